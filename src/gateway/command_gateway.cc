#define REALMLINK_LOG_COMPONENT "gateway"

#include "realmlink/gateway/command_gateway.h"

#include <exception>

#include "realmlink/logging/log_macros.h"
#include "realmlink/protocol/nested_path.h"
#include "realmlink/protocol/pending_request.h"

namespace realmlink {
namespace gateway {

namespace {

constexpr char kSocketUrlSuffix[] = ".goodgamestudios.com";

// "<label>.goodgamestudios.com" with a label of letters, digits and dashes
bool isGameServerHost(const std::string& url) {
  const size_t suffix_length = sizeof(kSocketUrlSuffix) - 1;
  if (url.size() <= suffix_length ||
      url.compare(url.size() - suffix_length, suffix_length,
                  kSocketUrlSuffix) != 0) {
    return false;
  }
  for (size_t i = 0; i < url.size() - suffix_length; ++i) {
    const char c = url[i];
    const bool allowed = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                         (c >= 'A' && c <= 'Z') || c == '-';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// Percent-decoding of one path segment; malformed escapes are kept as-is
std::string decodeSegment(const std::string& segment) {
  std::string out;
  out.reserve(segment.size());
  for (size_t i = 0; i < segment.size(); ++i) {
    if (segment[i] == '%' && i + 2 < segment.size()) {
      const int hi = hexValue(segment[i + 1]);
      const int lo = hexValue(segment[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(segment[i]);
  }
  return out;
}

// Non-empty string member of a request body, "" otherwise
std::string stringField(const nlohmann::json& body, const char* name) {
  auto it = body.find(name);
  if (it == body.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

nlohmann::json timeoutReply(const std::string& server,
                            const std::string& command,
                            const nlohmann::json& response_headers) {
  return {{"error", "Timeout"},
          {"server", server},
          {"command", command},
          {"response_headers", response_headers},
          {"return_code", -1}};
}

}  // namespace

GatewayResponse GatewayResponse::json(int status, const nlohmann::json& body) {
  GatewayResponse response;
  response.status = status;
  response.body = body.dump();
  return response;
}

GatewayResponse GatewayResponse::text(int status, std::string body) {
  GatewayResponse response;
  response.status = status;
  response.content_type = "text/html; charset=utf-8";
  response.body = std::move(body);
  return response;
}

const std::vector<std::pair<std::string, std::string>>& corsHeaders() {
  static const std::vector<std::pair<std::string, std::string>> headers = {
      {"Access-Control-Allow-Origin", "*"},
      {"Access-Control-Allow-Methods", "GET, POST, DELETE"},
      {"Access-Control-Allow-Headers",
       "Origin, X-Requested-With, Content-Type, Accept"},
  };
  return headers;
}

std::vector<std::string> splitPath(const std::string& path) {
  std::string clean = path.substr(0, path.find('?'));
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= clean.size()) {
    size_t end = clean.find('/', start);
    if (end == std::string::npos) {
      end = clean.size();
    }
    if (end > start) {
      segments.push_back(decodeSegment(clean.substr(start, end - start)));
    } else if (start != 0 && end < clean.size()) {
      // Keep interior empty segments so "/a//b" never matches a route
      segments.emplace_back();
    }
    start = end + 1;
  }
  return segments;
}

CommandGateway::CommandGateway(directory::ConnectionDirectory& directory)
    : directory_(directory) {}

void CommandGateway::handle(const std::string& method,
                            const std::string& path,
                            const std::string& body,
                            ResponseCb cb) {
  REALMLINK_LOG(Debug, "{} {}", method, path);
  try {
    route(method, splitPath(path), body, cb);
  } catch (const std::exception& e) {
    REALMLINK_LOG(Error, "{} {} failed: {}", method, path, e.what());
    cb(GatewayResponse::json(500, {{"error", e.what()}}));
  }
}

void CommandGateway::route(const std::string& method,
                           const std::vector<std::string>& segments,
                           const std::string& body,
                           ResponseCb& cb) {
  if (method == "GET") {
    if (segments.empty()) {
      cb(GatewayResponse::text(200, "API running"));
      return;
    }
    if (segments.size() == 1 && segments[0] == "status") {
      cb(status());
      return;
    }
    if (segments.size() == 3 && !segments[0].empty() &&
        !segments[1].empty() && !segments[2].empty()) {
      executeCommand(segments[0], segments[1], segments[2], cb);
      return;
    }
  } else if (method == "POST") {
    if (segments.size() == 1 && segments[0] == "server") {
      cb(addServer(body));
      return;
    }
  } else if (method == "DELETE") {
    if (segments.size() == 2 && segments[0] == "server" &&
        !segments[1].empty()) {
      cb(deleteServer(segments[1]));
      return;
    }
  }
  cb(GatewayResponse::json(404, {{"error", "Not found"}}));
}

void CommandGateway::executeCommand(const std::string& server,
                                    const std::string& command,
                                    const std::string& headers,
                                    ResponseCb cb) {
  client::LoginMachine* machine = directory_.find(server);
  if (!machine) {
    cb(GatewayResponse::json(404, {{"error", "Server not found"}}));
    return;
  }
  if (!machine->isConnected()) {
    cb(GatewayResponse::json(500, {{"error", "Server not connected"}}));
    return;
  }

  nlohmann::json message_headers;
  try {
    message_headers =
        nlohmann::json::parse("{" + (headers == "null" ? "" : headers) + "}");
  } catch (const nlohmann::json::parse_error& e) {
    REALMLINK_LOG(Warning, "[{}] Invalid headers for {}: {}", server, command,
                  e.what());
    cb(GatewayResponse::json(
        200, timeoutReply(server, command, nlohmann::json::object())));
    return;
  }

  nlohmann::json response_headers = expectedHeaders(command, message_headers);
  // The reply to "jca" arrives as "jaa"
  const std::string reply_command = command == "jca" ? "jaa" : command;

  protocol::ProtocolEngine& engine = machine->engine();
  engine.waitForDelimited(
      reply_command, protocol::MatchSpec::fromJson(response_headers),
      [server, reply_command, response_headers,
       cb](Result<protocol::ParsedResponse> result) {
        const protocol::DelimitedFrame* frame =
            isError(result)
                ? nullptr
                : get_if<protocol::DelimitedFrame>(&getValue(result));
        if (!frame) {
          REALMLINK_LOG(Debug, "[{}] No reply to {}", server, reply_command);
          cb(GatewayResponse::json(
              200, timeoutReply(server, reply_command, response_headers)));
          return;
        }
        cb(GatewayResponse::json(200, {{"server", server},
                                       {"command", reply_command},
                                       {"return_code", frame->status},
                                       {"content", frame->payload}}));
      },
      kCommandTimeout);
  engine.sendJson(command, message_headers);
}

nlohmann::json CommandGateway::expectedHeaders(
    const std::string& command,
    const nlohmann::json& headers) const {
  const nlohmann::json& mapping = directory_.data().commandMapping(command);
  if (!mapping.is_object()) {
    return headers;
  }
  nlohmann::json expected = nlohmann::json::object();
  for (const auto& entry : mapping.items()) {
    if (!entry.value().is_string()) {
      continue;
    }
    auto it = headers.find(entry.key());
    if (it != headers.end()) {
      protocol::setNestedValue(expected, entry.value().get<std::string>(),
                               *it);
    }
  }
  return expected;
}

GatewayResponse CommandGateway::status() const {
  nlohmann::json body = nlohmann::json::object();
  for (const auto& entry : directory_.status()) {
    body[entry.first] = entry.second;
  }
  return GatewayResponse::json(200, body);
}

GatewayResponse CommandGateway::addServer(const std::string& body) {
  nlohmann::json request = nlohmann::json::parse(body, nullptr, false);
  if (request.is_discarded() || !request.is_object()) {
    return GatewayResponse::json(400, {{"error", "Invalid JSON body"}});
  }
  const std::string server = stringField(request, "server");
  const std::string socket_url = stringField(request, "socket_url");
  const std::string username = stringField(request, "username");
  const std::string password = stringField(request, "password");
  if (server.empty() || socket_url.empty() || username.empty() ||
      password.empty()) {
    return GatewayResponse::json(400, {{"error", "Missing parameters"}});
  }

  // An existing connection goes away even if the new URL is rejected
  directory_.remove(server);
  if (!isGameServerHost(socket_url)) {
    REALMLINK_LOG(Warning, "[{}] Rejected socket URL {}", server, socket_url);
    return GatewayResponse::json(400, {{"error", "Invalid socket URL"}});
  }

  directory_.addLive(server, socket_url, username, password);
  REALMLINK_LOG(Info, "[{}] Live server added at {}", server, socket_url);
  return GatewayResponse::json(200, {{"message", "Server added"}});
}

GatewayResponse CommandGateway::deleteServer(const std::string& server) {
  if (!directory_.remove(server)) {
    return GatewayResponse::json(404, {{"error", "Server not found"}});
  }
  return GatewayResponse::json(200, {{"message", "Server deleted"}});
}

}  // namespace gateway
}  // namespace realmlink
