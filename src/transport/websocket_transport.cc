#include "realmlink/transport/websocket_transport.h"

#include <vector>

#define REALMLINK_LOG_COMPONENT "transport"
#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace transport {

namespace {

constexpr uint16_t kCloseProtocolError = 1002;

}  // namespace

WebSocketTransport::WebSocketTransport(event::Dispatcher& dispatcher,
                                       const Endpoint& endpoint,
                                       SslContextSharedPtr ssl)
    : endpoint_(endpoint),
      socket_(dispatcher, *this, endpoint.secure() ? std::move(ssl) : nullptr) {}

WebSocketTransport::~WebSocketTransport() { socket_.close(); }

void WebSocketTransport::setCallbacks(TransportCallbacks& callbacks) {
  callbacks_ = &callbacks;
}

void WebSocketTransport::open() {
  state_ = State::Connecting;
  closed_by_owner_ = false;
  handshake_buffer_.clear();
  decoder_ = WsFrameDecoder();
  REALMLINK_LOG(Debug, "Opening WebSocket to {}://{}:{}{}", endpoint_.scheme,
                endpoint_.host, endpoint_.port, endpoint_.path);
  socket_.connect(endpoint_.host, endpoint_.port);
}

bool WebSocketTransport::send(const std::string& message) {
  if (state_ != State::Open) {
    return false;
  }
  return socket_.write(encodeWsFrame(WsOpcode::Text, message));
}

void WebSocketTransport::close() {
  closed_by_owner_ = true;
  if (state_ == State::Open) {
    socket_.write(encodeWsFrame(WsOpcode::Close,
                                encodeWsClosePayload(kCloseNormal, "")));
  }
  socket_.close();
  state_ = State::Closed;
}

void WebSocketTransport::onConnected() {
  state_ = State::Upgrading;
  key_ = generateWsKey();
  socket_.write(buildWsHandshakeRequest(endpoint_, key_));
}

void WebSocketTransport::onReceive(const char* data, size_t length) {
  if (state_ == State::Upgrading) {
    handshake_buffer_.append(data, length);
    auto checked = checkWsHandshakeResponse(handshake_buffer_, key_);
    if (isError(checked)) {
      fatal(getError(checked).message);
      return;
    }
    const size_t head = getValue(checked);
    if (head == 0) {
      return;
    }

    // Frames may follow the response head in the same read
    std::string rest = handshake_buffer_.substr(head);
    handshake_buffer_.clear();
    state_ = State::Open;
    REALMLINK_LOG(Debug, "WebSocket upgraded for {}", endpoint_.host);
    if (callbacks_) {
      callbacks_->onOpen();
    }
    if (state_ == State::Open && !rest.empty()) {
      processFrames(rest.data(), rest.size());
    }
    return;
  }

  if (state_ == State::Open) {
    processFrames(data, length);
  }
}

void WebSocketTransport::processFrames(const char* data, size_t length) {
  std::vector<WsMessage> messages;
  auto fed = decoder_.feed(data, length, messages);

  for (auto& message : messages) {
    // The owner may close this transport from any callback
    if (state_ != State::Open) {
      return;
    }
    switch (message.opcode) {
      case WsOpcode::Text:
      case WsOpcode::Binary:
        if (callbacks_) {
          callbacks_->onData(message.payload);
        }
        break;
      case WsOpcode::Ping:
        socket_.write(encodeWsFrame(WsOpcode::Pong, message.payload));
        break;
      case WsOpcode::Pong:
        break;
      case WsOpcode::Close:
        handleClose(message.payload);
        return;
      default:
        break;
    }
  }

  if (isError(fed) && state_ == State::Open) {
    socket_.write(encodeWsFrame(
        WsOpcode::Close,
        encodeWsClosePayload(kCloseProtocolError, "protocol error")));
    fatal(getError(fed).message);
  }
}

void WebSocketTransport::handleClose(const std::string& payload) {
  int code = kCloseNormal;
  std::string reason;
  if (payload.size() >= 2) {
    code = (static_cast<uint8_t>(payload[0]) << 8) |
           static_cast<uint8_t>(payload[1]);
    reason = payload.substr(2);
  }

  // Echo the close and drop the connection
  socket_.write(encodeWsFrame(WsOpcode::Close, payload.substr(0, 2)));
  socket_.close();
  state_ = State::Closed;
  if (callbacks_) {
    callbacks_->onClose(code, reason);
  }
}

void WebSocketTransport::fatal(const std::string& error) {
  socket_.close();
  state_ = State::Closed;
  if (!callbacks_) {
    return;
  }
  callbacks_->onError(error);
  if (!closed_by_owner_) {
    callbacks_->onClose(kCloseAbnormal, error);
  }
}

void WebSocketTransport::onSocketError(const std::string& error) {
  if (state_ == State::Closed) {
    return;
  }
  fatal(error);
}

void WebSocketTransport::onSocketClosed() {
  if (state_ == State::Closed) {
    return;
  }
  state_ = State::Closed;
  if (callbacks_) {
    callbacks_->onClose(kCloseAbnormal, "Connection closed by peer");
  }
}

}  // namespace transport
}  // namespace realmlink
