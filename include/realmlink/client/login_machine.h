/**
 * @file login_machine.h
 * @brief Handshake and login sequence driving one protocol engine
 *
 * Every server variant shares the same prologue:
 *
 *   open transport        wait up to 60s for the engine's opened flag
 *   sys/verChk/0          -> sys/apiOK/0
 *   sys/login/0           -> nfo (status must be 0)
 *   sys/autoJoin/-1       -> sys/joinOK/1
 *   sys/roundTrip/1       -> sys/roundTripRes/1
 *
 * after which the variant's own login() takes over. Each step is a callback
 * on the engine's correlated waits; a step that fails or times out ends the
 * attempt through onAttemptFailed().
 */

#ifndef REALMLINK_CLIENT_LOGIN_MACHINE_H
#define REALMLINK_CLIENT_LOGIN_MACHINE_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "realmlink/config/data_files.h"
#include "realmlink/logging/logger_registry.h"
#include "realmlink/protocol/engine.h"

namespace realmlink {
namespace client {

constexpr std::chrono::milliseconds kOpenTimeout{60 * 1000};
constexpr int kLoginOk = 0;
constexpr int kInvalidCredentials = 21;

class LoginMachine : public event::DeferredDeletable {
 public:
  LoginMachine(event::Dispatcher& dispatcher,
               protocol::ConnectionIdentity identity,
               config::Credentials credentials,
               transport::TransportFactory transport_factory,
               protocol::EngineOptions options);
  ~LoginMachine() override;

  LoginMachine(const LoginMachine&) = delete;
  LoginMachine& operator=(const LoginMachine&) = delete;

  /**
   * Start one connect attempt. Any attempt still in progress is abandoned;
   * its outstanding waits complete into nothing. Also installed as the
   * engine's connect routine so restarts come back here.
   */
  void connect();

  void restart() { engine_->restart(); }

  // Stop for good: abandon the attempt and drop the connection
  void close();

  protocol::ProtocolEngine& engine() { return *engine_; }
  const protocol::ProtocolEngine& engine() const { return *engine_; }
  bool isConnected() const { return engine_->isConnected(); }
  const std::string& zone() const { return engine_->identity().zone; }
  protocol::ServerType serverType() const { return engine_->identity().type; }

 protected:
  using DelimitedCb = std::function<void(const protocol::DelimitedFrame&)>;

  // Variant login, entered once the prologue completed
  virtual void login() = 0;

  // A connect attempt ended before steady state. Retries in 5 minutes.
  virtual void onAttemptFailed(const std::string& message);

  /**
   * Register a wait for the next frame of the given command. Call before
   * sending the request. next runs only if the attempt is still current; a
   * timeout fails the attempt.
   */
  void expectDelimited(const std::string& command, DelimitedCb next);
  void expectXml(const std::string& tag,
                 const std::string& action,
                 const std::string& room,
                 std::function<void()> next);

  // Runs fn, turning an escaping exception into a failed attempt
  void guarded(const std::function<void()>& fn);

  void fail(const std::string& message);

  // Enter steady state after a successful login
  void enterSteadyState(bool check_connection);

  const config::Credentials& credentials() const { return credentials_; }
  logging::ConnectionLogger& log() { return log_; }

 private:
  void onOpened(bool ok);
  void startHandshake();
  bool current(uint64_t attempt) const { return attempt == attempt_; }

  config::Credentials credentials_;
  logging::ConnectionLogger log_;
  std::unique_ptr<protocol::ProtocolEngine> engine_;
  uint64_t attempt_{0};
};

using LoginMachinePtr = std::unique_ptr<LoginMachine>;

}  // namespace client
}  // namespace realmlink

#endif  // REALMLINK_CLIENT_LOGIN_MACHINE_H
