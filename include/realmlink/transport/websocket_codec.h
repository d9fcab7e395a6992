/**
 * @file websocket_codec.h
 * @brief RFC 6455 client framing and opening handshake
 */

#ifndef REALMLINK_TRANSPORT_WEBSOCKET_CODEC_H
#define REALMLINK_TRANSPORT_WEBSOCKET_CODEC_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "realmlink/core/result.h"
#include "realmlink/transport/endpoint.h"

namespace realmlink {
namespace transport {

enum class WsOpcode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA
};

using WsMask = std::array<uint8_t, 4>;

struct WsMessage {
  WsOpcode opcode{WsOpcode::Text};
  std::string payload;
};

// Masked client frame with FIN set
std::string encodeWsFrame(WsOpcode opcode,
                          const std::string& payload,
                          const WsMask& mask);

// Same with a random mask
std::string encodeWsFrame(WsOpcode opcode, const std::string& payload);

// Close frame payload: 2-byte code then UTF-8 reason
std::string encodeWsClosePayload(uint16_t code, const std::string& reason);

/**
 * Incremental decoder for server frames.
 *
 * Bytes may arrive in arbitrary chunks. Fragmented data messages are
 * reassembled; control frames are delivered as they arrive, including
 * between fragments.
 */
class WsFrameDecoder {
 public:
  static constexpr uint64_t kMaxMessageSize = 16 * 1024 * 1024;

  // Append complete messages to out. An error leaves the decoder unusable.
  VoidResult feed(const char* data, size_t length, std::vector<WsMessage>& out);

  size_t bufferedBytes() const { return buffer_.size(); }

 private:
  std::string buffer_;
  bool in_fragment_{false};
  WsOpcode fragment_opcode_{WsOpcode::Text};
  std::string fragment_;
};

// Random 16-byte key, base64 encoded
std::string generateWsKey();

// Expected Sec-WebSocket-Accept for a key
std::string computeWsAccept(const std::string& key);

std::string buildWsHandshakeRequest(const Endpoint& endpoint,
                                    const std::string& key);

/**
 * Validate the server's handshake response held at the start of buffer.
 * Returns the size of the response head once complete, 0 while more bytes
 * are needed, or an error for a rejected upgrade.
 */
Result<size_t> checkWsHandshakeResponse(const std::string& buffer,
                                        const std::string& key);

}  // namespace transport
}  // namespace realmlink

#endif  // REALMLINK_TRANSPORT_WEBSOCKET_CODEC_H
