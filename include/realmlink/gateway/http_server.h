/**
 * @file http_server.h
 * @brief libevent evhttp front end of the command gateway
 *
 * Runs on the dispatcher's event_base, so gateway handlers and the protocol
 * engines share one thread. Replies may be written long after the request
 * callback returned. evhttp detaches a request from its connection when the
 * client hangs up, and sending the reply then only frees the request.
 */

#ifndef REALMLINK_GATEWAY_HTTP_SERVER_H
#define REALMLINK_GATEWAY_HTTP_SERVER_H

#include <cstdint>
#include <memory>
#include <string>

#include "realmlink/core/result.h"
#include "realmlink/event/libevent_dispatcher.h"
#include "realmlink/gateway/command_gateway.h"

struct evhttp;
struct evhttp_bound_socket;
struct evhttp_request;

namespace realmlink {
namespace gateway {

class HttpServer {
 public:
  HttpServer(event::LibeventDispatcher& dispatcher, CommandGateway& gateway);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Start listening. Port 0 picks a free port, see port().
  VoidResult bind(const std::string& address, uint16_t port);

  uint16_t port() const { return port_; }

 private:
  static void onRequest(evhttp_request* request, void* arg);

  void dispatch(evhttp_request* request);
  static void reply(evhttp_request* request, const GatewayResponse& response);

  CommandGateway& gateway_;
  evhttp* http_{nullptr};
  evhttp_bound_socket* socket_{nullptr};
  uint16_t port_{0};
  // Requests still waiting for a reply are freed with http_
  std::shared_ptr<bool> alive_;
};

}  // namespace gateway
}  // namespace realmlink

#endif  // REALMLINK_GATEWAY_HTTP_SERVER_H
