#include "realmlink/transport/endpoint.h"

#include <algorithm>
#include <cctype>

namespace realmlink {
namespace transport {

namespace {

uint16_t defaultPort(const std::string& scheme) {
  if (scheme == "ws" || scheme == "http") {
    return 80;
  }
  return 443;
}

}  // namespace

Result<Endpoint> parseEndpoint(const std::string& url) {
  Endpoint endpoint;
  std::string rest = url;

  const size_t scheme_end = url.find("://");
  if (scheme_end != std::string::npos) {
    endpoint.scheme = url.substr(0, scheme_end);
    std::transform(endpoint.scheme.begin(), endpoint.scheme.end(),
                   endpoint.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    rest = url.substr(scheme_end + 3);
  }

  const size_t path_start = rest.find('/');
  if (path_start != std::string::npos) {
    endpoint.path = rest.substr(path_start);
    rest = rest.substr(0, path_start);
  }

  const size_t colon = rest.rfind(':');
  if (colon != std::string::npos) {
    const std::string port_text = rest.substr(colon + 1);
    rest = rest.substr(0, colon);
    size_t consumed = 0;
    int port = 0;
    try {
      port = std::stoi(port_text, &consumed);
    } catch (const std::exception&) {
      consumed = 0;
    }
    if (consumed == 0 || consumed != port_text.size() || port <= 0 ||
        port > 65535) {
      return makeError<Endpoint>(errors::kInvalidArgument,
                                 "Invalid port in " + url);
    }
    endpoint.port = static_cast<uint16_t>(port);
  } else {
    endpoint.port = defaultPort(endpoint.scheme);
  }

  if (rest.empty()) {
    return makeError<Endpoint>(errors::kInvalidArgument,
                               "Missing host in " + url);
  }
  endpoint.host = rest;
  return makeSuccess(std::move(endpoint));
}

}  // namespace transport
}  // namespace realmlink
