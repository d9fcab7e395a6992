#include "realmlink/protocol/frame_codec.h"

#include <string>

#include <fmt/format.h>

namespace realmlink {
namespace protocol {

namespace {

constexpr char kXmlTagOpen[] = "<msg t='";
constexpr char kXmlActionOpen[] = "'><body action='";
constexpr char kXmlRoomOpen[] = "' r='";
constexpr char kXmlBodyOpen[] = "'>";
constexpr char kXmlClose[] = "</body></msg>";

// Text between `pos` and the next `delimiter`; advances `pos` past it
bool extractUntil(const std::string& text,
                  const char* delimiter,
                  size_t& pos,
                  std::string& out) {
  const size_t end = text.find(delimiter, pos);
  if (end == std::string::npos) {
    return false;
  }
  out = text.substr(pos, end - pos);
  pos = end + std::char_traits<char>::length(delimiter);
  return true;
}

bool parseStatus(const std::string& text, int& status) {
  size_t pos = 0;
  try {
    status = std::stoi(text, &pos);
  } catch (const std::exception&) {
    return false;
  }
  return pos == text.size();
}

Result<ParsedResponse> parseXml(const std::string& text) {
  size_t pos = text.find(kXmlTagOpen);
  if (pos == std::string::npos) {
    return makeError<ParsedResponse>(errors::kParseError,
                                     "Malformed XML frame");
  }
  pos += std::char_traits<char>::length(kXmlTagOpen);
  XmlFrame frame;
  if (!extractUntil(text, kXmlActionOpen, pos, frame.tag) ||
      !extractUntil(text, kXmlRoomOpen, pos, frame.action) ||
      !extractUntil(text, kXmlBodyOpen, pos, frame.room) ||
      !extractUntil(text, kXmlClose, pos, frame.body)) {
    return makeError<ParsedResponse>(errors::kParseError,
                                     "Malformed XML frame");
  }
  return ParsedResponse(std::move(frame));
}

Result<ParsedResponse> parseDelimited(const std::string& text) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('%', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    if (end > start) {
      segments.push_back(text.substr(start, end - start));
    }
    start = end + 1;
  }

  if (segments.size() < 4) {
    return makeError<ParsedResponse>(
        errors::kParseError,
        fmt::format("Delimited frame has {} segments", segments.size()));
  }

  DelimitedFrame frame;
  frame.command = segments[1];
  if (!parseStatus(segments[3], frame.status)) {
    return makeError<ParsedResponse>(
        errors::kParseError,
        fmt::format("Invalid status '{}' in frame {}", segments[3],
                    frame.command));
  }

  if (segments.size() > 4) {
    std::string data = segments[4];
    for (size_t i = 5; i < segments.size(); ++i) {
      data += '%';
      data += segments[i];
    }
    if (data[0] == '{') {
      frame.payload = nlohmann::json::parse(data, nullptr, false);
      if (frame.payload.is_discarded()) {
        return makeError<ParsedResponse>(
            errors::kParseError,
            fmt::format("Invalid JSON payload in frame {}", frame.command));
      }
    } else {
      frame.payload = data;
    }
  }

  return ParsedResponse(std::move(frame));
}

}  // namespace

Result<ParsedResponse> parseFrame(const std::string& text) {
  if (!text.empty() && text[0] == '<') {
    return parseXml(text);
  }
  return parseDelimited(text);
}

std::string encodeCommand(const std::string& zone,
                          const std::string& command,
                          const std::vector<std::string>& args) {
  std::string out = fmt::format("%xt%{}%{}%1%", zone, command);
  for (const auto& arg : args) {
    out += arg;
    out += '%';
  }
  return out;
}

std::string encodeJsonCommand(const std::string& zone,
                              const std::string& command,
                              const nlohmann::json& data) {
  return encodeCommand(zone, command, {data.dump()});
}

std::string encodeXml(const std::string& tag,
                      const std::string& action,
                      const std::string& room,
                      const std::string& body) {
  return fmt::format("<msg t='{}'><body action='{}' r='{}'>{}</body></msg>",
                     tag, action, room, body);
}

}  // namespace protocol
}  // namespace realmlink
