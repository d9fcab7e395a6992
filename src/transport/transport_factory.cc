#include "realmlink/transport/transport_factory.h"

#include "realmlink/transport/endpoint.h"
#include "realmlink/transport/tcp_transport.h"
#include "realmlink/transport/websocket_transport.h"

#define REALMLINK_LOG_COMPONENT "transport"
#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace transport {

TransportFactory createTransportFactory(event::Dispatcher& dispatcher,
                                        SslContextSharedPtr ssl) {
  return [&dispatcher, ssl](const std::string& url) -> TransportPtr {
    auto parsed = parseEndpoint(url);
    if (isError(parsed)) {
      REALMLINK_LOG(Error, "{}", getError(parsed).message);
      return nullptr;
    }
    const Endpoint& endpoint = getValue(parsed);

    if (endpoint.websocket()) {
      if (endpoint.secure() && !ssl) {
        REALMLINK_LOG(Error, "No TLS context for {}", url);
        return nullptr;
      }
      return std::make_unique<WebSocketTransport>(dispatcher, endpoint, ssl);
    }
    if (endpoint.scheme.empty() || endpoint.scheme == "tcp") {
      return std::make_unique<TcpTransport>(dispatcher, endpoint);
    }
    REALMLINK_LOG(Error, "Unsupported transport scheme '{}' in {}",
                  endpoint.scheme, url);
    return nullptr;
  };
}

TransportFactory createTcpTransportFactory(event::Dispatcher& dispatcher) {
  return [&dispatcher](const std::string& url) -> TransportPtr {
    // Drop the scheme so the default port is 443 whatever it was
    const size_t scheme_end = url.find("://");
    const std::string address =
        scheme_end == std::string::npos ? url : url.substr(scheme_end + 3);
    auto parsed = parseEndpoint(address);
    if (isError(parsed)) {
      REALMLINK_LOG(Error, "{}", getError(parsed).message);
      return nullptr;
    }
    return std::make_unique<TcpTransport>(dispatcher, getValue(parsed));
  };
}

}  // namespace transport
}  // namespace realmlink
