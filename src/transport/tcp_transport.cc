#include "realmlink/transport/tcp_transport.h"

#include <vector>

#define REALMLINK_LOG_COMPONENT "transport"
#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace transport {

TcpTransport::TcpTransport(event::Dispatcher& dispatcher,
                           const Endpoint& endpoint)
    : endpoint_(endpoint), socket_(dispatcher, *this, nullptr) {}

TcpTransport::~TcpTransport() { socket_.close(); }

void TcpTransport::setCallbacks(TransportCallbacks& callbacks) {
  callbacks_ = &callbacks;
}

void TcpTransport::open() {
  open_ = false;
  closed_by_owner_ = false;
  read_buffer_.clear();
  REALMLINK_LOG(Debug, "Opening TCP stream to {}:{}", endpoint_.host,
                endpoint_.port);
  socket_.connect(endpoint_.host, endpoint_.port);
}

bool TcpTransport::send(const std::string& message) {
  if (!open_) {
    return false;
  }
  std::string framed = message;
  framed.push_back('\0');
  return socket_.write(framed);
}

void TcpTransport::close() {
  closed_by_owner_ = true;
  open_ = false;
  socket_.close();
}

void TcpTransport::onConnected() {
  open_ = true;
  if (callbacks_) {
    callbacks_->onOpen();
  }
}

void TcpTransport::onReceive(const char* data, size_t length) {
  read_buffer_.append(data, length);

  std::vector<std::string> messages;
  size_t start = 0;
  size_t nul;
  while ((nul = read_buffer_.find('\0', start)) != std::string::npos) {
    if (nul > start) {
      messages.push_back(read_buffer_.substr(start, nul - start));
    }
    start = nul + 1;
  }
  read_buffer_.erase(0, start);

  for (const auto& message : messages) {
    if (!open_ || !callbacks_) {
      return;
    }
    callbacks_->onData(message);
  }
}

void TcpTransport::onSocketError(const std::string& error) {
  open_ = false;
  if (!callbacks_) {
    return;
  }
  callbacks_->onError(error);
  if (!closed_by_owner_) {
    callbacks_->onClose(kCloseAbnormal, error);
  }
}

void TcpTransport::onSocketClosed() {
  open_ = false;
  if (callbacks_) {
    callbacks_->onClose(kCloseAbnormal, "Connection closed by peer");
  }
}

}  // namespace transport
}  // namespace realmlink
