#include "realmlink/transport/stream_socket.h"

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>

#include <openssl/err.h>
#include <openssl/ssl.h>

#define REALMLINK_LOG_COMPONENT "transport"
#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace transport {

namespace {

constexpr size_t kReadChunk = 16384;

uint32_t readEvents() {
  return static_cast<uint32_t>(event::FileReadyType::Read);
}

uint32_t writeEvents() {
  return static_cast<uint32_t>(event::FileReadyType::Write);
}

std::string errnoMessage(int err) { return std::string(::strerror(err)); }

}  // namespace

StreamSocket::StreamSocket(event::Dispatcher& dispatcher,
                           StreamSocketCallbacks& callbacks,
                           SslContextSharedPtr ssl)
    : dispatcher_(dispatcher),
      callbacks_(callbacks),
      ssl_context_(std::move(ssl)) {
  failure_timer_ = dispatcher_.createTimer([this]() {
    std::string error = std::move(pending_failure_);
    fail(error);
  });
}

StreamSocket::~StreamSocket() {
  release();
  file_event_.reset();
}

void StreamSocket::connect(const std::string& host, uint16_t port) {
  release();
  file_event_.reset();
  host_ = host;
  state_ = State::Connecting;

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* addresses = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &addresses);
  if (rc != 0) {
    scheduleFailure("Failed to resolve " + host + ": " + gai_strerror(rc));
    return;
  }

  std::string last_error = "no usable address";
  for (struct addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK |
                                         SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_error = errnoMessage(errno);
      continue;
    }
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0 ||
        errno == EINPROGRESS) {
      fd_ = fd;
      break;
    }
    last_error = errnoMessage(errno);
    ::close(fd);
  }
  ::freeaddrinfo(addresses);

  if (fd_ < 0) {
    scheduleFailure("Failed to connect to " + host + ":" + service + ": " +
                    last_error);
    return;
  }

  REALMLINK_LOG(Debug, "Connecting to {}:{} (fd {})", host, port, fd_);
  file_event_ = dispatcher_.createFileEvent(
      fd_, [this](uint32_t events) { onFileEvent(events); }, writeEvents());
}

bool StreamSocket::write(const std::string& data) {
  if (state_ != State::Connected) {
    return false;
  }
  write_buffer_ += data;
  flushWrites();
  return true;
}

void StreamSocket::close() {
  failure_timer_->disableTimer();
  if (ssl_ && state_ == State::Connected) {
    // Best effort close_notify; the peer may already be gone
    SSL_shutdown(ssl_);
  }
  release();
  state_ = State::Closed;
}

void StreamSocket::onFileEvent(uint32_t events) {
  switch (state_) {
    case State::Connecting:
      onConnectComplete();
      return;
    case State::Handshaking:
      continueHandshake();
      return;
    case State::Connected:
      break;
    default:
      return;
  }

  if (events & writeEvents()) {
    want_write_ = false;
    if (!flushWrites()) {
      return;
    }
  }
  if (events & (readEvents() |
                static_cast<uint32_t>(event::FileReadyType::Closed))) {
    if (!doRead()) {
      return;
    }
  }
  updateInterest();
}

void StreamSocket::onConnectComplete() {
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
    err = errno;
  }
  if (err != 0) {
    fail("Failed to connect to " + host_ + ": " + errnoMessage(err));
    return;
  }

  if (ssl_context_) {
    startTls();
    return;
  }

  state_ = State::Connected;
  updateInterest();
  callbacks_.onConnected();
}

void StreamSocket::startTls() {
  ssl_ = ssl_context_->newSsl(host_);
  if (!ssl_) {
    fail("Failed to create TLS session");
    return;
  }
  if (SSL_set_fd(ssl_, fd_) != 1) {
    fail("Failed to attach TLS session: " + SslContext::lastError());
    return;
  }
  state_ = State::Handshaking;
  continueHandshake();
}

void StreamSocket::continueHandshake() {
  ERR_clear_error();
  int ret = SSL_do_handshake(ssl_);
  if (ret == 1) {
    if (ssl_context_->getConfig().verify_peer) {
      auto verified = SslContext::verifyPeer(ssl_);
      if (isError(verified)) {
        fail(getError(verified).message);
        return;
      }
    }
    REALMLINK_LOG(Debug, "TLS established with {} ({})", host_,
                  SSL_get_version(ssl_));
    state_ = State::Connected;
    want_write_ = false;
    updateInterest();
    callbacks_.onConnected();
    return;
  }

  switch (SSL_get_error(ssl_, ret)) {
    case SSL_ERROR_WANT_READ:
      want_write_ = false;
      updateInterest();
      return;
    case SSL_ERROR_WANT_WRITE:
      want_write_ = true;
      updateInterest();
      return;
    default:
      fail("TLS handshake with " + host_ + " failed: " +
           SslContext::lastError());
      return;
  }
}

bool StreamSocket::doRead() {
  char buffer[kReadChunk];
  while (state_ == State::Connected) {
    if (ssl_) {
      ERR_clear_error();
      int n = SSL_read(ssl_, buffer, sizeof(buffer));
      if (n > 0) {
        callbacks_.onReceive(buffer, static_cast<size_t>(n));
        continue;
      }
      switch (SSL_get_error(ssl_, n)) {
        case SSL_ERROR_WANT_READ:
          return true;
        case SSL_ERROR_WANT_WRITE:
          want_write_ = true;
          return true;
        case SSL_ERROR_ZERO_RETURN:
          peerClosed();
          return false;
        default:
          fail("TLS read failed: " + SslContext::lastError());
          return false;
      }
    }

    ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
    if (n > 0) {
      callbacks_.onReceive(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      peerClosed();
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return true;
    }
    fail("Read failed: " + errnoMessage(errno));
    return false;
  }
  // Closed by the owner from inside onReceive
  return false;
}

bool StreamSocket::flushWrites() {
  while (!write_buffer_.empty()) {
    if (ssl_) {
      ERR_clear_error();
      int n = SSL_write(ssl_, write_buffer_.data(),
                        static_cast<int>(write_buffer_.size()));
      if (n > 0) {
        write_buffer_.erase(0, static_cast<size_t>(n));
        continue;
      }
      int err = SSL_get_error(ssl_, n);
      if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
        break;
      }
      scheduleFailure("TLS write failed: " + SslContext::lastError());
      return false;
    }

    ssize_t n = ::send(fd_, write_buffer_.data(), write_buffer_.size(),
                       MSG_NOSIGNAL);
    if (n > 0) {
      write_buffer_.erase(0, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      break;
    }
    scheduleFailure("Write failed: " + errnoMessage(errno));
    return false;
  }
  updateInterest();
  return true;
}

void StreamSocket::updateInterest() {
  if (!file_event_ || fd_ < 0) {
    return;
  }
  uint32_t events = 0;
  if (state_ == State::Connecting) {
    events = writeEvents();
  } else {
    events = readEvents();
    if (want_write_ || !write_buffer_.empty()) {
      events |= writeEvents();
    }
  }
  file_event_->setEnabled(events);
}

void StreamSocket::scheduleFailure(const std::string& error) {
  // Stop I/O now, report on the next turn so callers never see a callback
  // from inside connect() or write()
  release();
  state_ = State::Closed;
  pending_failure_ = error;
  failure_timer_->enableTimer(std::chrono::milliseconds(0));
}

void StreamSocket::fail(const std::string& error) {
  REALMLINK_LOG(Debug, "Socket to {} failed: {}", host_, error);
  release();
  state_ = State::Closed;
  callbacks_.onSocketError(error);
}

void StreamSocket::peerClosed() {
  REALMLINK_LOG(Debug, "Peer {} closed the stream", host_);
  release();
  state_ = State::Closed;
  callbacks_.onSocketClosed();
}

void StreamSocket::release() {
  if (file_event_) {
    // The event may be the one currently dispatching; it is freed later
    file_event_->setEnabled(0);
  }
  if (ssl_) {
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  write_buffer_.clear();
  want_write_ = false;
}

}  // namespace transport
}  // namespace realmlink
