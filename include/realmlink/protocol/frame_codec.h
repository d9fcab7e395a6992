#ifndef REALMLINK_PROTOCOL_FRAME_CODEC_H
#define REALMLINK_PROTOCOL_FRAME_CODEC_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "realmlink/core/result.h"

namespace realmlink {
namespace protocol {

// "%xt%<zone>%<command>%1%<args...>%" frames after login
struct DelimitedFrame {
  std::string command;
  int status{0};
  // Object when the raw text started with '{', string otherwise, null when
  // the frame carried no payload segment
  nlohmann::json payload;
};

// "<msg t='..'><body action='..' r='..'>..</body></msg>" handshake frames
struct XmlFrame {
  std::string tag;
  std::string action;
  std::string room;
  std::string body;
};

using ParsedResponse = variant<DelimitedFrame, XmlFrame>;

/**
 * Decode one inbound message. Text starting with '<' is an XML frame,
 * anything else a delimited frame. Malformed frames yield kParseError.
 */
Result<ParsedResponse> parseFrame(const std::string& text);

std::string encodeCommand(const std::string& zone,
                          const std::string& command,
                          const std::vector<std::string>& args);

// Same framing with the payload serialized as the single argument
std::string encodeJsonCommand(const std::string& zone,
                              const std::string& command,
                              const nlohmann::json& data);

std::string encodeXml(const std::string& tag,
                      const std::string& action,
                      const std::string& room,
                      const std::string& body);

}  // namespace protocol
}  // namespace realmlink

#endif  // REALMLINK_PROTOCOL_FRAME_CODEC_H
