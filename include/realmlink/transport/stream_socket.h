/**
 * @file stream_socket.h
 * @brief Non-blocking client TCP stream with optional TLS
 *
 * Connects on the dispatcher, runs the TLS handshake when a context is
 * given, and then moves bytes in both directions. Both message transports
 * are built on it.
 */

#ifndef REALMLINK_TRANSPORT_STREAM_SOCKET_H
#define REALMLINK_TRANSPORT_STREAM_SOCKET_H

#include <cstdint>
#include <string>

#include "realmlink/event/event_loop.h"
#include "realmlink/transport/ssl_context.h"

namespace realmlink {
namespace transport {

class StreamSocketCallbacks {
 public:
  virtual ~StreamSocketCallbacks() = default;

  // TCP connected and, for TLS, handshake finished
  virtual void onConnected() = 0;

  virtual void onReceive(const char* data, size_t length) = 0;

  // Connect, handshake or I/O failure. The socket is already closed.
  virtual void onSocketError(const std::string& error) = 0;

  // Orderly end of stream from the peer. The socket is already closed.
  virtual void onSocketClosed() = 0;
};

class StreamSocket {
 public:
  enum class State { Idle, Connecting, Handshaking, Connected, Closed };

  // ssl may be null for plain TCP
  StreamSocket(event::Dispatcher& dispatcher,
               StreamSocketCallbacks& callbacks,
               SslContextSharedPtr ssl);
  ~StreamSocket();

  StreamSocket(const StreamSocket&) = delete;
  StreamSocket& operator=(const StreamSocket&) = delete;

  // Resolve and start a non-blocking connect. Failures are reported through
  // onSocketError on a later dispatcher turn.
  void connect(const std::string& host, uint16_t port);

  // Queue bytes and flush as far as the socket allows
  bool write(const std::string& data);

  // Close without raising any callback
  void close();

  State state() const { return state_; }
  bool connected() const { return state_ == State::Connected; }
  size_t pendingWriteBytes() const { return write_buffer_.size(); }

 private:
  void onFileEvent(uint32_t events);
  void onConnectComplete();
  void startTls();
  void continueHandshake();
  // Both return false once the socket has been closed
  bool doRead();
  bool flushWrites();
  void updateInterest();
  void scheduleFailure(const std::string& error);
  void fail(const std::string& error);
  void peerClosed();
  void release();

  event::Dispatcher& dispatcher_;
  StreamSocketCallbacks& callbacks_;
  SslContextSharedPtr ssl_context_;

  int fd_{-1};
  SSL* ssl_{nullptr};
  std::string host_;
  State state_{State::Idle};
  bool want_write_{false};
  event::FileEventPtr file_event_;
  event::TimerPtr failure_timer_;
  std::string pending_failure_;
  std::string write_buffer_;
};

}  // namespace transport
}  // namespace realmlink

#endif  // REALMLINK_TRANSPORT_STREAM_SOCKET_H
