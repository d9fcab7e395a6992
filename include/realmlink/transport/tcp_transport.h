#ifndef REALMLINK_TRANSPORT_TCP_TRANSPORT_H
#define REALMLINK_TRANSPORT_TCP_TRANSPORT_H

#include <string>

#include "realmlink/transport/endpoint.h"
#include "realmlink/transport/stream_socket.h"
#include "realmlink/transport/transport.h"

namespace realmlink {
namespace transport {

/**
 * Raw byte-stream transport. Messages are terminated by a single NUL byte
 * in both directions; a trailing partial message is kept until the rest
 * arrives.
 */
class TcpTransport : public Transport, public StreamSocketCallbacks {
 public:
  TcpTransport(event::Dispatcher& dispatcher, const Endpoint& endpoint);
  ~TcpTransport() override;

  // Transport
  void setCallbacks(TransportCallbacks& callbacks) override;
  void open() override;
  bool send(const std::string& message) override;
  void close() override;
  bool isOpen() const override { return open_; }

  size_t bufferedBytes() const { return read_buffer_.size(); }

  // StreamSocketCallbacks
  void onConnected() override;
  void onReceive(const char* data, size_t length) override;
  void onSocketError(const std::string& error) override;
  void onSocketClosed() override;

 private:
  Endpoint endpoint_;
  StreamSocket socket_;
  TransportCallbacks* callbacks_{nullptr};
  bool open_{false};
  bool closed_by_owner_{false};
  std::string read_buffer_;
};

}  // namespace transport
}  // namespace realmlink

#endif  // REALMLINK_TRANSPORT_TCP_TRANSPORT_H
