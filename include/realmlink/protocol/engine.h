/**
 * @file engine.h
 * @brief Per-connection protocol engine
 *
 * Owns the transport of one game server connection, frames outbound
 * commands, decodes inbound frames and hands them to correlated waiters, and
 * drives heartbeat, health checks and reconnect backoff.
 */

#ifndef REALMLINK_PROTOCOL_ENGINE_H
#define REALMLINK_PROTOCOL_ENGINE_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "realmlink/core/result.h"
#include "realmlink/event/event_loop.h"
#include "realmlink/event/waitable_flag.h"
#include "realmlink/logging/logger_registry.h"
#include "realmlink/protocol/frame_codec.h"
#include "realmlink/protocol/pending_request.h"
#include "realmlink/transport/transport.h"

namespace realmlink {
namespace protocol {

enum class ServerType { EP, E4K, LIVE };

const char* serverTypeName(ServerType type);

struct ConnectionIdentity {
  ServerType type{ServerType::EP};
  std::string zone;
  std::string url;
};

struct EngineOptions {
  // Send "gbl {}" one second after every successful login
  bool housekeeping{false};
  // Restart with backoff on transport errors
  bool auto_reconnect{true};
  // Extra seconds added to each backoff delay; defaults to uniform 0..29
  std::function<int()> jitter;
};

// Timer periods of the steady state
constexpr std::chrono::milliseconds kDefaultResponseTimeout{5000};
constexpr std::chrono::milliseconds kHeartbeatInterval{60 * 1000};
constexpr std::chrono::milliseconds kHousekeepingDelay{1000};
constexpr std::chrono::milliseconds kHealthCheckInterval{15 * 60 * 1000};
constexpr std::chrono::milliseconds kHealthRetryDelay{10 * 1000};
constexpr std::chrono::milliseconds kStaleCheckDelay{10 * 60 * 1000};
constexpr std::chrono::milliseconds kErrorRetryDelay{5 * 60 * 1000};

class ProtocolEngine : public transport::TransportCallbacks {
 public:
  using ResponseCb = std::function<void(Result<ParsedResponse>)>;
  using ConnectRoutine = std::function<void()>;

  ProtocolEngine(event::Dispatcher& dispatcher,
                 ConnectionIdentity identity,
                 transport::TransportFactory transport_factory,
                 EngineOptions options);
  ~ProtocolEngine() override;

  ProtocolEngine(const ProtocolEngine&) = delete;
  ProtocolEngine& operator=(const ProtocolEngine&) = delete;

  // Routine run by restart() once the backoff delay expires
  void setConnectRoutine(ConnectRoutine routine) {
    connect_routine_ = std::move(routine);
  }

  /**
   * Replace the current transport with a fresh one and start opening it.
   * Resets the opened/closed flags; connected is left to the login.
   */
  void init();

  // Close the transport without reconnect bookkeeping
  void close();

  void sendRaw(const std::string& command, const std::vector<std::string>& args);
  void sendJson(const std::string& command, const nlohmann::json& data);
  void sendXml(const std::string& tag,
               const std::string& action,
               const std::string& room,
               const std::string& body);

  /**
   * Register a correlated wait for a delimited frame. The callback receives
   * the first matching frame, or a kTimeout error. Registration happens
   * before this returns, so callers may send after registering.
   */
  void waitForDelimited(const std::string& command,
                        MatchSpec match,
                        ResponseCb cb,
                        std::chrono::milliseconds timeout =
                            kDefaultResponseTimeout);

  void waitForXml(const std::string& tag,
                  const std::string& action,
                  const std::string& room,
                  ResponseCb cb,
                  std::chrono::milliseconds timeout = kDefaultResponseTimeout);

  /**
   * Enter steady state after a successful login: mark connected, start the
   * heartbeat, schedule housekeeping, reset backoff and start health checks.
   */
  void pingAndCheck();

  /**
   * Health check. While connected, sends "gpi" and expects an answer; while
   * disconnected, arms a one-shot stale check. At most one check is in
   * flight at a time.
   */
  void checkConnection();

  void disconnect(bool reconnect = true);

  // Disconnect and schedule the connect routine after backoff plus jitter
  void restart();

  // Log a failed connect attempt and restart after the delay
  void handleErrorResponse(const std::string& message,
                           std::chrono::milliseconds delay = kErrorRetryDelay);

  /**
   * Answer every outstanding wait with kTimeout now. Runs on destruction so
   * that callers waiting on a removed connection still get their reply.
   */
  void failPending();

  // Base delay for the given zero-based attempt number
  static std::chrono::seconds backoffDelay(uint32_t attempt);

  event::WaitableFlag& opened() { return opened_; }
  event::WaitableFlag& connected() { return connected_; }
  event::WaitableFlag& closed() { return closed_; }

  bool isConnected() const { return connected_.isSet(); }
  bool reconnectRequested() const { return reconnect_; }
  uint32_t reconnectAttempts() const { return reconnect_attempts_; }
  size_t pendingCount() const { return pending_.size(); }

  const ConnectionIdentity& identity() const { return identity_; }
  const EngineOptions& options() const { return options_; }
  event::Dispatcher& dispatcher() { return dispatcher_; }
  logging::ConnectionLogger& log() { return log_; }

  // TransportCallbacks
  void onOpen() override;
  void onData(const std::string& message) override;
  void onError(const std::string& error) override;
  void onClose(int code, const std::string& reason) override;

 private:
  void send(const std::string& message);
  void ping();
  void dispatchResponse(ParsedResponse response);
  void registerPending(PendingRequestPtr request,
                       ResponseCb cb,
                       std::chrono::milliseconds timeout);
  void onCheckResult(const Result<ParsedResponse>& result);

  event::Dispatcher& dispatcher_;
  ConnectionIdentity identity_;
  transport::TransportFactory transport_factory_;
  EngineOptions options_;
  logging::ConnectionLogger log_;

  transport::TransportPtr transport_;
  ConnectRoutine connect_routine_;

  event::WaitableFlag opened_;
  event::WaitableFlag connected_;
  event::WaitableFlag closed_;
  bool reconnect_{true};
  uint32_t reconnect_attempts_{0};
  bool check_in_flight_{false};

  std::list<PendingRequestPtr> pending_;

  event::TimerPtr heartbeat_timer_;
  event::TimerPtr housekeeping_timer_;
  event::TimerPtr check_timer_;
  event::TimerPtr check_retry_timer_;
  event::TimerPtr stale_check_timer_;
  event::TimerPtr restart_timer_;
  event::TimerPtr error_retry_timer_;
};

using ProtocolEnginePtr = std::unique_ptr<ProtocolEngine>;

}  // namespace protocol
}  // namespace realmlink

#endif  // REALMLINK_PROTOCOL_ENGINE_H
