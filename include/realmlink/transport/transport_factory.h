#ifndef REALMLINK_TRANSPORT_TRANSPORT_FACTORY_H
#define REALMLINK_TRANSPORT_TRANSPORT_FACTORY_H

#include "realmlink/event/event_loop.h"
#include "realmlink/transport/ssl_context.h"
#include "realmlink/transport/transport.h"

namespace realmlink {
namespace transport {

/**
 * WebSocket transports for ws:// and wss:// URLs, TCP for tcp:// and
 * scheme-less host[:port]. Returns nullptr for anything else, and for wss
 * when no TLS context is available.
 */
TransportFactory createTransportFactory(event::Dispatcher& dispatcher,
                                        SslContextSharedPtr ssl);

// Always a NUL-delimited TCP stream; any scheme prefix is ignored and the
// port defaults to 443
TransportFactory createTcpTransportFactory(event::Dispatcher& dispatcher);

}  // namespace transport
}  // namespace realmlink

#endif  // REALMLINK_TRANSPORT_TRANSPORT_FACTORY_H
