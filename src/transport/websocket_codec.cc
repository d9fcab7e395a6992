#include "realmlink/transport/websocket_codec.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <fmt/format.h>

namespace realmlink {
namespace transport {

namespace {

const char kWebSocketGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr size_t kMaxHandshakeSize = 16 * 1024;

std::string base64Encode(const unsigned char* data, size_t length) {
  std::string out(4 * ((length + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                data, static_cast<int>(length));
  out.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return out;
}

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string trim(const std::string& text) {
  const size_t first = text.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::string();
  }
  const size_t last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

bool isControl(uint8_t opcode) { return (opcode & 0x08) != 0; }

VoidResult protocolError(const std::string& message) {
  return makeVoidError(Error(errors::kParseError, message));
}

}  // namespace

std::string encodeWsFrame(WsOpcode opcode,
                          const std::string& payload,
                          const WsMask& mask) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));

  const uint64_t length = payload.size();
  if (length < 126) {
    frame.push_back(static_cast<char>(0x80 | length));
  } else if (length <= 0xFFFF) {
    frame.push_back(static_cast<char>(0x80 | 126));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
  } else {
    frame.push_back(static_cast<char>(0x80 | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((length >> shift) & 0xFF));
    }
  }

  for (uint8_t byte : mask) {
    frame.push_back(static_cast<char>(byte));
  }
  for (size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
  }
  return frame;
}

std::string encodeWsFrame(WsOpcode opcode, const std::string& payload) {
  WsMask mask{};
  if (RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1) {
    // RFC 6455 only needs the mask to be unpredictable to intermediaries
    for (auto& byte : mask) {
      byte = static_cast<uint8_t>(std::rand() & 0xFF);
    }
  }
  return encodeWsFrame(opcode, payload, mask);
}

std::string encodeWsClosePayload(uint16_t code, const std::string& reason) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  payload += reason.substr(0, 123);
  return payload;
}

VoidResult WsFrameDecoder::feed(const char* data,
                                size_t length,
                                std::vector<WsMessage>& out) {
  buffer_.append(data, length);

  while (buffer_.size() >= 2) {
    const auto b0 = static_cast<uint8_t>(buffer_[0]);
    const auto b1 = static_cast<uint8_t>(buffer_[1]);
    const bool fin = (b0 & 0x80) != 0;
    const uint8_t opcode = b0 & 0x0F;
    const bool masked = (b1 & 0x80) != 0;

    if (b0 & 0x70) {
      return protocolError("Reserved bits set in frame header");
    }

    size_t header = 2;
    uint64_t payload_length = b1 & 0x7F;
    if (payload_length == 126) {
      if (buffer_.size() < 4) {
        return makeVoidSuccess();
      }
      payload_length = (static_cast<uint64_t>(static_cast<uint8_t>(buffer_[2]))
                        << 8) |
                       static_cast<uint8_t>(buffer_[3]);
      header = 4;
    } else if (payload_length == 127) {
      if (buffer_.size() < 10) {
        return makeVoidSuccess();
      }
      payload_length = 0;
      for (size_t i = 2; i < 10; ++i) {
        payload_length = (payload_length << 8) | static_cast<uint8_t>(buffer_[i]);
      }
      header = 10;
    }

    if (payload_length > kMaxMessageSize) {
      return protocolError(
          fmt::format("Frame of {} bytes exceeds limit", payload_length));
    }

    const size_t mask_offset = header;
    if (masked) {
      header += 4;
    }
    if (buffer_.size() < header + payload_length) {
      return makeVoidSuccess();
    }

    std::string payload = buffer_.substr(header, payload_length);
    if (masked) {
      for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(
            payload[i] ^ buffer_[mask_offset + (i % 4)]);
      }
    }
    buffer_.erase(0, header + payload_length);

    if (isControl(opcode)) {
      if (!fin || payload_length > 125) {
        return protocolError("Invalid control frame");
      }
      if (opcode != static_cast<uint8_t>(WsOpcode::Close) &&
          opcode != static_cast<uint8_t>(WsOpcode::Ping) &&
          opcode != static_cast<uint8_t>(WsOpcode::Pong)) {
        return protocolError(fmt::format("Unknown opcode {:#x}", opcode));
      }
      out.push_back(WsMessage{static_cast<WsOpcode>(opcode), std::move(payload)});
      continue;
    }

    switch (static_cast<WsOpcode>(opcode)) {
      case WsOpcode::Text:
      case WsOpcode::Binary:
        if (in_fragment_) {
          return protocolError("New message inside a fragmented message");
        }
        if (fin) {
          out.push_back(
              WsMessage{static_cast<WsOpcode>(opcode), std::move(payload)});
        } else {
          in_fragment_ = true;
          fragment_opcode_ = static_cast<WsOpcode>(opcode);
          fragment_ = std::move(payload);
        }
        break;
      case WsOpcode::Continuation:
        if (!in_fragment_) {
          return protocolError("Continuation without a message");
        }
        if (fragment_.size() + payload.size() > kMaxMessageSize) {
          return protocolError("Fragmented message exceeds limit");
        }
        fragment_ += payload;
        if (fin) {
          out.push_back(WsMessage{fragment_opcode_, std::move(fragment_)});
          fragment_.clear();
          in_fragment_ = false;
        }
        break;
      default:
        return protocolError(fmt::format("Unknown opcode {:#x}", opcode));
    }
  }
  return makeVoidSuccess();
}

std::string generateWsKey() {
  unsigned char nonce[16];
  if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
    for (auto& byte : nonce) {
      byte = static_cast<unsigned char>(std::rand() & 0xFF);
    }
  }
  return base64Encode(nonce, sizeof(nonce));
}

std::string computeWsAccept(const std::string& key) {
  const std::string input = key + kWebSocketGuid;
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_length = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &digest_length,
                 EVP_sha1(), nullptr) != 1) {
    return std::string();
  }
  return base64Encode(digest, digest_length);
}

std::string buildWsHandshakeRequest(const Endpoint& endpoint,
                                    const std::string& key) {
  const bool default_port = (endpoint.secure() && endpoint.port == 443) ||
                            (!endpoint.secure() && endpoint.port == 80);
  const std::string host =
      default_port ? endpoint.host
                   : fmt::format("{}:{}", endpoint.host, endpoint.port);
  return fmt::format(
      "GET {} HTTP/1.1\r\n"
      "Host: {}\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Key: {}\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "\r\n",
      endpoint.path, host, key);
}

Result<size_t> checkWsHandshakeResponse(const std::string& buffer,
                                        const std::string& key) {
  const size_t end = buffer.find("\r\n\r\n");
  if (end == std::string::npos) {
    if (buffer.size() > kMaxHandshakeSize) {
      return makeError<size_t>(errors::kParseError,
                               "Handshake response too large");
    }
    return makeSuccess(size_t(0));
  }

  const std::string head = buffer.substr(0, end);
  size_t line_end = head.find("\r\n");
  const std::string status_line = head.substr(0, line_end);
  if (status_line.compare(0, 12, "HTTP/1.1 101") != 0) {
    return makeError<size_t>(errors::kTransportError,
                             "Unexpected server response: " + status_line);
  }

  std::string upgrade;
  std::string accept;
  while (line_end != std::string::npos) {
    const size_t start = line_end + 2;
    line_end = head.find("\r\n", start);
    const std::string line = head.substr(
        start, line_end == std::string::npos ? std::string::npos
                                             : line_end - start);
    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string name = toLower(trim(line.substr(0, colon)));
    const std::string value = trim(line.substr(colon + 1));
    if (name == "upgrade") {
      upgrade = toLower(value);
    } else if (name == "sec-websocket-accept") {
      accept = value;
    }
  }

  if (upgrade != "websocket") {
    return makeError<size_t>(errors::kTransportError,
                             "Missing Upgrade: websocket header");
  }
  if (accept != computeWsAccept(key)) {
    return makeError<size_t>(errors::kTransportError,
                             "Invalid Sec-WebSocket-Accept");
  }
  return makeSuccess(end + 4);
}

}  // namespace transport
}  // namespace realmlink
