#ifndef REALMLINK_PROTOCOL_PENDING_REQUEST_H
#define REALMLINK_PROTOCOL_PENDING_REQUEST_H

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "realmlink/core/compat.h"
#include "realmlink/event/waitable_flag.h"
#include "realmlink/protocol/frame_codec.h"

namespace realmlink {
namespace protocol {

/**
 * Payload predicate for a delimited wait.
 *
 *   Any             any payload, including none
 *   RequirePayload  payload must be present
 *   Exact           payload equals the value (strings, numbers)
 *   Pattern         structured payload matching compareNested()
 */
class MatchSpec {
 public:
  enum class Kind { Any, RequirePayload, Exact, Pattern };

  MatchSpec() = default;

  static MatchSpec any() { return MatchSpec(); }
  static MatchSpec requirePayload() {
    return MatchSpec(Kind::RequirePayload, nullptr);
  }
  static MatchSpec exact(nlohmann::json value) {
    return MatchSpec(Kind::Exact, std::move(value));
  }
  static MatchSpec pattern(nlohmann::json value) {
    return MatchSpec(Kind::Pattern, std::move(value));
  }

  // false -> Any, true -> RequirePayload, object/array -> Pattern,
  // anything else -> Exact
  static MatchSpec fromJson(const nlohmann::json& value);

  bool matches(const nlohmann::json& payload) const;

  Kind kind() const { return kind_; }
  const nlohmann::json& value() const { return value_; }

 private:
  MatchSpec(Kind kind, nlohmann::json value)
      : kind_(kind), value_(std::move(value)) {}

  Kind kind_{Kind::Any};
  nlohmann::json value_;
};

/**
 * One outstanding send-and-wait on a connection. Owned by the engine's
 * pending list until it is matched or times out.
 */
class PendingRequest : public event::DeferredDeletable {
 public:
  // Delimited wait
  PendingRequest(event::Dispatcher& dispatcher,
                 const std::string& command,
                 MatchSpec match);
  // XML wait
  PendingRequest(event::Dispatcher& dispatcher,
                 const std::string& tag,
                 const std::string& action,
                 const std::string& room);

  bool isXml() const { return xml_; }

  // Delimited frames match on command and payload predicate, XML frames on
  // tag, action and room
  bool matches(const ParsedResponse& response) const;

  void complete(ParsedResponse response) {
    response_ = std::move(response);
    completed_.set();
  }

  const optional<ParsedResponse>& response() const { return response_; }
  event::WaitableFlag& completed() { return completed_; }

  std::string describe() const;

 private:
  bool xml_;
  std::string command_;
  MatchSpec match_;
  std::string tag_;
  std::string action_;
  std::string room_;
  optional<ParsedResponse> response_;
  event::WaitableFlag completed_;
};

using PendingRequestPtr = std::unique_ptr<PendingRequest>;

}  // namespace protocol
}  // namespace realmlink

#endif  // REALMLINK_PROTOCOL_PENDING_REQUEST_H
