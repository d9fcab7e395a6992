#include "realmlink/client/live_server_login.h"

namespace realmlink {
namespace client {

namespace {

protocol::EngineOptions liveOptions() {
  protocol::EngineOptions options;
  options.auto_reconnect = false;
  return options;
}

}  // namespace

LiveServerLogin::LiveServerLogin(event::Dispatcher& dispatcher,
                                 const std::string& zone,
                                 const std::string& url,
                                 config::Credentials credentials,
                                 transport::TransportFactory transport_factory)
    : LoginMachine(dispatcher,
                   protocol::ConnectionIdentity{protocol::ServerType::LIVE,
                                                zone, url},
                   std::move(credentials),
                   std::move(transport_factory),
                   liveOptions()) {}

void LiveServerLogin::login() {
  expectDelimited("lli", [this](const protocol::DelimitedFrame& lli) {
    if (lli.status == kLoginOk) {
      enterSteadyState(true);
      return;
    }
    if (lli.status == kInvalidCredentials) {
      log().error(
          "Login failed: Invalid credentials. Please check your USERNAME "
          "and PASSWORD.");
      return;
    }
    log().error("Login failed with status: {}", lli.status);
  });

  engine().sendJson("tlep", {{"TLT", credentials().password}});
  log().info("Sent login command with username: {}", credentials().username);
}

void LiveServerLogin::onAttemptFailed(const std::string& message) {
  log().error("{}", message);
}

}  // namespace client
}  // namespace realmlink
