#define REALMLINK_LOG_COMPONENT "gateway"

#include "realmlink/gateway/http_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <stdexcept>

#include <event2/buffer.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <fmt/format.h>

#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace gateway {

namespace {

const char* methodName(enum evhttp_cmd_type command) {
  switch (command) {
    case EVHTTP_REQ_GET:
      return "GET";
    case EVHTTP_REQ_POST:
      return "POST";
    case EVHTTP_REQ_DELETE:
      return "DELETE";
    case EVHTTP_REQ_OPTIONS:
      return "OPTIONS";
    default:
      return "OTHER";
  }
}

const char* reasonPhrase(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 500:
      return "Internal Server Error";
    default:
      return "";
  }
}

}  // namespace

HttpServer::HttpServer(event::LibeventDispatcher& dispatcher,
                       CommandGateway& gateway)
    : gateway_(gateway), alive_(std::make_shared<bool>(true)) {
  http_ = evhttp_new(dispatcher.base());
  if (!http_) {
    throw std::runtime_error("Failed to create HTTP server");
  }
  evhttp_set_allowed_methods(http_, EVHTTP_REQ_GET | EVHTTP_REQ_POST |
                                        EVHTTP_REQ_DELETE |
                                        EVHTTP_REQ_OPTIONS);
  evhttp_set_gencb(http_, &HttpServer::onRequest, this);
}

HttpServer::~HttpServer() {
  *alive_ = false;
  if (http_) {
    evhttp_free(http_);
  }
}

VoidResult HttpServer::bind(const std::string& address, uint16_t port) {
  socket_ = evhttp_bind_socket_with_handle(http_, address.c_str(), port);
  if (!socket_) {
    return makeVoidError(Error(errors::kIoError,
                               fmt::format("Failed to bind {}:{}", address,
                                           port)));
  }

  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  const evutil_socket_t fd = evhttp_bound_socket_get_fd(socket_);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    if (addr.ss_family == AF_INET) {
      port_ = ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    } else if (addr.ss_family == AF_INET6) {
      port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
  } else {
    port_ = port;
  }
  REALMLINK_LOG(Info, "Gateway listening on {}:{}", address, port_);
  return makeVoidSuccess();
}

void HttpServer::onRequest(evhttp_request* request, void* arg) {
  static_cast<HttpServer*>(arg)->dispatch(request);
}

void HttpServer::dispatch(evhttp_request* request) {
  const enum evhttp_cmd_type command = evhttp_request_get_command(request);
  const char* uri = evhttp_request_get_uri(request);

  if (command == EVHTTP_REQ_OPTIONS) {
    GatewayResponse preflight;
    preflight.status = 204;
    preflight.content_type.clear();
    reply(request, preflight);
    return;
  }

  std::string body;
  evbuffer* input = evhttp_request_get_input_buffer(request);
  const size_t length = evbuffer_get_length(input);
  if (length > 0) {
    body.resize(length);
    evbuffer_copyout(input, &body[0], length);
  }

  std::weak_ptr<bool> alive = alive_;
  gateway_.handle(methodName(command), uri ? uri : "/", body,
                  [alive, request](GatewayResponse response) {
                    auto guard = alive.lock();
                    if (!guard || !*guard) {
                      return;
                    }
                    reply(request, response);
                  });
}

void HttpServer::reply(evhttp_request* request,
                       const GatewayResponse& response) {
  evkeyvalq* headers = evhttp_request_get_output_headers(request);
  for (const auto& header : corsHeaders()) {
    evhttp_add_header(headers, header.first.c_str(), header.second.c_str());
  }
  if (!response.content_type.empty()) {
    evhttp_add_header(headers, "Content-Type", response.content_type.c_str());
  }

  evbuffer* output = evbuffer_new();
  if (!output) {
    evhttp_send_error(request, 500, nullptr);
    return;
  }
  evbuffer_add(output, response.body.data(), response.body.size());
  evhttp_send_reply(request, response.status, reasonPhrase(response.status),
                    output);
  evbuffer_free(output);
}

}  // namespace gateway
}  // namespace realmlink
