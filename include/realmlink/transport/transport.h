/**
 * @file transport.h
 * @brief Message transport contract shared by the WebSocket and TCP backends
 */

#ifndef REALMLINK_TRANSPORT_TRANSPORT_H
#define REALMLINK_TRANSPORT_TRANSPORT_H

#include <functional>
#include <memory>
#include <string>

#include "realmlink/event/event_loop.h"

namespace realmlink {
namespace transport {

// Close codes reported through onClose
constexpr int kCloseNormal = 1000;
constexpr int kCloseAbnormal = 1006;

/**
 * Events raised by a transport. All are delivered on the dispatcher thread.
 */
class TransportCallbacks {
 public:
  virtual ~TransportCallbacks() = default;

  virtual void onOpen() = 0;

  // One complete inbound message
  virtual void onData(const std::string& message) = 0;

  virtual void onError(const std::string& error) = 0;

  // Raised once per transport when the peer or the network ends it. A
  // close() requested by the owner is not reported.
  virtual void onClose(int code, const std::string& reason) = 0;
};

/**
 * A single ordered message stream to one server.
 *
 * Transports are deferred-deletable so the owner can drop one from inside
 * its own callbacks.
 */
class Transport : public event::DeferredDeletable {
 public:
  ~Transport() override = default;

  virtual void setCallbacks(TransportCallbacks& callbacks) = 0;

  // Start connecting; onOpen or onError/onClose follows
  virtual void open() = 0;

  // Queue one outbound message. Returns false when the transport is not open.
  virtual bool send(const std::string& message) = 0;

  virtual void close() = 0;

  virtual bool isOpen() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

// Builds a transport for a server URL (ws://, wss://, tcp://)
using TransportFactory = std::function<TransportPtr(const std::string& url)>;

}  // namespace transport
}  // namespace realmlink

#endif  // REALMLINK_TRANSPORT_TRANSPORT_H
