#include "realmlink/protocol/pending_request.h"

#include <fmt/format.h>

#include "realmlink/protocol/nested_path.h"

namespace realmlink {
namespace protocol {

MatchSpec MatchSpec::fromJson(const nlohmann::json& value) {
  if (value.is_boolean()) {
    return value.get<bool>() ? requirePayload() : any();
  }
  if (value.is_object() || value.is_array()) {
    return pattern(value);
  }
  return exact(value);
}

bool MatchSpec::matches(const nlohmann::json& payload) const {
  switch (kind_) {
    case Kind::Any:
      return true;
    case Kind::RequirePayload:
      return !payload.is_null();
    case Kind::Exact:
      return payload == value_;
    case Kind::Pattern:
      return (payload.is_object() || payload.is_array()) &&
             compareNested(value_, payload);
  }
  return false;
}

PendingRequest::PendingRequest(event::Dispatcher& dispatcher,
                               const std::string& command,
                               MatchSpec match)
    : xml_(false),
      command_(command),
      match_(std::move(match)),
      completed_(dispatcher) {}

PendingRequest::PendingRequest(event::Dispatcher& dispatcher,
                               const std::string& tag,
                               const std::string& action,
                               const std::string& room)
    : xml_(true),
      tag_(tag),
      action_(action),
      room_(room),
      completed_(dispatcher) {}

bool PendingRequest::matches(const ParsedResponse& response) const {
  if (xml_) {
    const auto* frame = get_if<XmlFrame>(&response);
    return frame && frame->tag == tag_ && frame->action == action_ &&
           frame->room == room_;
  }
  const auto* frame = get_if<DelimitedFrame>(&response);
  return frame && frame->command == command_ && match_.matches(frame->payload);
}

std::string PendingRequest::describe() const {
  if (xml_) {
    return fmt::format("{}/{}/{}", tag_, action_, room_);
  }
  return command_;
}

}  // namespace protocol
}  // namespace realmlink
