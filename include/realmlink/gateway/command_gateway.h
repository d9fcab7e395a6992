/**
 * @file command_gateway.h
 * @brief REST routes over the connection directory
 *
 * Routes:
 *
 *   GET    /                          "API running"
 *   GET    /status                    {zone: connected}
 *   GET    /:server/:command/:headers command bridge
 *   POST   /server                    add a temporary live server
 *   DELETE /server/:server            close and forget a connection
 *
 * The gateway knows nothing about sockets; HttpServer feeds it requests and
 * writes back the GatewayResponse it produces.
 */

#ifndef REALMLINK_GATEWAY_COMMAND_GATEWAY_H
#define REALMLINK_GATEWAY_COMMAND_GATEWAY_H

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "realmlink/directory/connection_directory.h"

namespace realmlink {
namespace gateway {

constexpr std::chrono::milliseconds kCommandTimeout{1000};

struct GatewayResponse {
  int status{200};
  std::string content_type{"application/json; charset=utf-8"};
  std::string body;

  static GatewayResponse json(int status, const nlohmann::json& body);
  static GatewayResponse text(int status, std::string body);
};

using ResponseCb = std::function<void(GatewayResponse)>;

// Headers added to every response
const std::vector<std::pair<std::string, std::string>>& corsHeaders();

class CommandGateway {
 public:
  explicit CommandGateway(directory::ConnectionDirectory& directory);

  /**
   * Route one request. cb runs exactly once, either before this returns or,
   * for the command bridge, from the dispatcher once the reply arrived or
   * the wait timed out. path may carry a query string; it is ignored.
   */
  void handle(const std::string& method,
              const std::string& path,
              const std::string& body,
              ResponseCb cb);

  /**
   * Forward a command to a connected server and answer with the correlated
   * reply. headers is the text of a JSON object without its braces; "null"
   * stands for no headers.
   */
  void executeCommand(const std::string& server,
                      const std::string& command,
                      const std::string& headers,
                      ResponseCb cb);

  GatewayResponse status() const;
  GatewayResponse addServer(const std::string& body);
  GatewayResponse deleteServer(const std::string& server);

  /**
   * Headers the reply to command must carry. Projects the request headers
   * through the command mapping when one exists, otherwise echoes them.
   */
  nlohmann::json expectedHeaders(const std::string& command,
                                 const nlohmann::json& headers) const;

 private:
  void route(const std::string& method,
             const std::vector<std::string>& segments,
             const std::string& body,
             ResponseCb& cb);

  directory::ConnectionDirectory& directory_;
};

// Split "/a/b%20c?x=1" into decoded segments {"a", "b c"}
std::vector<std::string> splitPath(const std::string& path);

}  // namespace gateway
}  // namespace realmlink

#endif  // REALMLINK_GATEWAY_COMMAND_GATEWAY_H
