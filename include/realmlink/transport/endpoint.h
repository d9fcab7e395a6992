#ifndef REALMLINK_TRANSPORT_ENDPOINT_H
#define REALMLINK_TRANSPORT_ENDPOINT_H

#include <cstdint>
#include <string>

#include "realmlink/core/result.h"

namespace realmlink {
namespace transport {

struct Endpoint {
  std::string scheme;  // lower case; empty when the URL had none
  std::string host;
  uint16_t port{0};
  std::string path{"/"};

  bool secure() const { return scheme == "wss" || scheme == "https"; }
  bool websocket() const { return scheme == "ws" || scheme == "wss"; }
};

/**
 * Split "scheme://host[:port][/path]". A missing port defaults to 80 for ws
 * and http, and to 443 otherwise, including scheme-less "host[:port]".
 */
Result<Endpoint> parseEndpoint(const std::string& url);

}  // namespace transport
}  // namespace realmlink

#endif  // REALMLINK_TRANSPORT_ENDPOINT_H
