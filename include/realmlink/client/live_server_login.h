#ifndef REALMLINK_CLIENT_LIVE_SERVER_LOGIN_H
#define REALMLINK_CLIENT_LIVE_SERVER_LOGIN_H

#include "realmlink/client/login_machine.h"

namespace realmlink {
namespace client {

/**
 * Temporary live servers added at runtime through the gateway. Logs in with
 * a "tlep" token and never retries on its own: failed attempts are only
 * logged, and the engine is built without auto-reconnect.
 */
class LiveServerLogin : public LoginMachine {
 public:
  LiveServerLogin(event::Dispatcher& dispatcher,
                  const std::string& zone,
                  const std::string& url,
                  config::Credentials credentials,
                  transport::TransportFactory transport_factory);

 protected:
  void login() override;
  void onAttemptFailed(const std::string& message) override;
};

}  // namespace client
}  // namespace realmlink

#endif  // REALMLINK_CLIENT_LIVE_SERVER_LOGIN_H
