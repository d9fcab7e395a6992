#include "realmlink/client/login_machine.h"

#include <exception>

#include <fmt/format.h>

namespace realmlink {
namespace client {

namespace {

constexpr char kVersionCheck[] = "<ver v='166' />";

std::string zoneLogin(const std::string& zone) {
  return fmt::format(
      "<login z='{}'><nick><![CDATA[]]></nick>"
      "<pword><![CDATA[1065004%fr%0]]></pword></login>",
      zone);
}

}  // namespace

LoginMachine::LoginMachine(event::Dispatcher& dispatcher,
                           protocol::ConnectionIdentity identity,
                           config::Credentials credentials,
                           transport::TransportFactory transport_factory,
                           protocol::EngineOptions options)
    : credentials_(std::move(credentials)),
      log_(logging::Component::Login,
           protocol::serverTypeName(identity.type),
           identity.zone) {
  engine_ = std::make_unique<protocol::ProtocolEngine>(
      dispatcher, std::move(identity), std::move(transport_factory),
      std::move(options));
  engine_->setConnectRoutine([this]() { connect(); });
}

LoginMachine::~LoginMachine() {
  // Waits of the login are ignored from here on; other waiters get a reply
  ++attempt_;
  engine_->failPending();
}

void LoginMachine::connect() {
  const uint64_t attempt = ++attempt_;
  log_.info("Connecting to socket server: {}", engine_->identity().url);
  engine_->init();
  engine_->opened().wait(kOpenTimeout, [this, attempt](bool ok) {
    if (current(attempt)) {
      onOpened(ok);
    }
  });
}

void LoginMachine::close() {
  ++attempt_;
  engine_->disconnect(false);
}

void LoginMachine::onOpened(bool ok) {
  if (!ok) {
    fail("Socket not connected");
    return;
  }
  guarded([this]() { startHandshake(); });
}

void LoginMachine::startHandshake() {
  log_.info("Socket connected, sending login commands...");

  expectXml("sys", "apiOK", "0", [this]() {
    expectDelimited("nfo", [this](const protocol::DelimitedFrame& nfo) {
      if (nfo.status != kLoginOk) {
        fail(fmt::format("Unexpected status: {}", nfo.status));
        return;
      }
      expectXml("sys", "joinOK", "1", [this]() {
        expectXml("sys", "roundTripRes", "1", [this]() { login(); });
        engine_->sendXml("sys", "roundTrip", "1", "");
      });
      engine_->sendXml("sys", "autoJoin", "-1", "");
    });
    engine_->sendXml("sys", "login", "0", zoneLogin(zone()));
  });
  engine_->sendXml("sys", "verChk", "0", kVersionCheck);
}

void LoginMachine::expectDelimited(const std::string& command,
                                   DelimitedCb next) {
  const uint64_t attempt = attempt_;
  engine_->waitForDelimited(
      command, protocol::MatchSpec::any(),
      [this, attempt, command,
       next](Result<protocol::ParsedResponse> result) {
        if (!current(attempt)) {
          return;
        }
        if (isError(result)) {
          fail(fmt::format("{} ({})", getError(result).message, command));
          return;
        }
        const auto* frame =
            get_if<protocol::DelimitedFrame>(&getValue(result));
        if (!frame) {
          fail(fmt::format("Unexpected frame waiting for {}", command));
          return;
        }
        guarded([&]() { next(*frame); });
      });
}

void LoginMachine::expectXml(const std::string& tag,
                             const std::string& action,
                             const std::string& room,
                             std::function<void()> next) {
  const uint64_t attempt = attempt_;
  engine_->waitForXml(
      tag, action, room,
      [this, attempt, tag, action, room,
       next](Result<protocol::ParsedResponse> result) {
        if (!current(attempt)) {
          return;
        }
        if (isError(result)) {
          fail(fmt::format("{} ({}/{}/{})", getError(result).message, tag,
                           action, room));
          return;
        }
        guarded(next);
      });
}

void LoginMachine::guarded(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    fail(e.what());
  }
}

void LoginMachine::fail(const std::string& message) {
  onAttemptFailed(message);
}

void LoginMachine::onAttemptFailed(const std::string& message) {
  engine_->handleErrorResponse(message +
                               " Retrying connection in 5 minutes...");
}

void LoginMachine::enterSteadyState(bool check_connection) {
  engine_->pingAndCheck();
  if (check_connection) {
    engine_->checkConnection();
  }
}

}  // namespace client
}  // namespace realmlink
