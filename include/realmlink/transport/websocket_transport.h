#ifndef REALMLINK_TRANSPORT_WEBSOCKET_TRANSPORT_H
#define REALMLINK_TRANSPORT_WEBSOCKET_TRANSPORT_H

#include <string>

#include "realmlink/transport/endpoint.h"
#include "realmlink/transport/stream_socket.h"
#include "realmlink/transport/transport.h"
#include "realmlink/transport/websocket_codec.h"

namespace realmlink {
namespace transport {

/**
 * Message-framed transport over ws:// or wss://. One text frame per
 * outbound message; each inbound data message is one onData.
 */
class WebSocketTransport : public Transport, public StreamSocketCallbacks {
 public:
  enum class State { Idle, Connecting, Upgrading, Open, Closed };

  // ssl must be set for wss endpoints
  WebSocketTransport(event::Dispatcher& dispatcher,
                     const Endpoint& endpoint,
                     SslContextSharedPtr ssl);
  ~WebSocketTransport() override;

  // Transport
  void setCallbacks(TransportCallbacks& callbacks) override;
  void open() override;
  bool send(const std::string& message) override;
  void close() override;
  bool isOpen() const override { return state_ == State::Open; }

  State state() const { return state_; }

  // StreamSocketCallbacks
  void onConnected() override;
  void onReceive(const char* data, size_t length) override;
  void onSocketError(const std::string& error) override;
  void onSocketClosed() override;

 private:
  void processFrames(const char* data, size_t length);
  void handleClose(const std::string& payload);
  void fatal(const std::string& error);

  Endpoint endpoint_;
  StreamSocket socket_;
  TransportCallbacks* callbacks_{nullptr};
  State state_{State::Idle};
  bool closed_by_owner_{false};
  std::string key_;
  std::string handshake_buffer_;
  WsFrameDecoder decoder_;
};

}  // namespace transport
}  // namespace realmlink

#endif  // REALMLINK_TRANSPORT_WEBSOCKET_TRANSPORT_H
