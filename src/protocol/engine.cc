#include "realmlink/protocol/engine.h"

#include <algorithm>
#include <random>

namespace realmlink {
namespace protocol {

namespace {

// Backoff in seconds for attempts 0..4; later attempts use the cap
constexpr int kBackoffTable[] = {120, 180, 300, 600, 1800};
constexpr int kBackoffCap = 3600;
constexpr int kMaxJitterSeconds = 29;

int defaultJitter() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<int> dist(0, kMaxJitterSeconds);
  return dist(rng);
}

}  // namespace

const char* serverTypeName(ServerType type) {
  switch (type) {
    case ServerType::EP:
      return "EP";
    case ServerType::E4K:
      return "E4K";
    case ServerType::LIVE:
      return "LIVE";
  }
  return "UNKNOWN";
}

ProtocolEngine::ProtocolEngine(event::Dispatcher& dispatcher,
                               ConnectionIdentity identity,
                               transport::TransportFactory transport_factory,
                               EngineOptions options)
    : dispatcher_(dispatcher),
      identity_(std::move(identity)),
      transport_factory_(std::move(transport_factory)),
      options_(std::move(options)),
      log_(logging::Component::Protocol,
           serverTypeName(identity_.type),
           identity_.zone),
      opened_(dispatcher),
      connected_(dispatcher),
      closed_(dispatcher) {
  heartbeat_timer_ = dispatcher_.createTimer([this]() { ping(); });
  housekeeping_timer_ = dispatcher_.createTimer([this]() {
    sendJson("gbl", nlohmann::json::object());
    log_.info("Sent gbl command to socket");
  });
  check_timer_ = dispatcher_.createTimer([this]() { checkConnection(); });
  check_retry_timer_ = dispatcher_.createTimer([this]() {
    if (connected_.isSet()) {
      restart();
      return;
    }
    // Whoever cleared connected owns the recovery
    log_.warning("Socket is not connected, not restarting");
  });
  stale_check_timer_ = dispatcher_.createTimer([this]() {
    if (!connected_.isSet() && !restart_timer_->enabled()) {
      restart();
    }
  });
  restart_timer_ = dispatcher_.createTimer([this]() {
    if (connect_routine_) {
      connect_routine_();
    } else {
      init();
    }
  });
  error_retry_timer_ = dispatcher_.createTimer([this]() { restart(); });
}

ProtocolEngine::~ProtocolEngine() {
  failPending();
  if (transport_) {
    // May be destroyed from inside one of the transport's callbacks
    transport_->close();
    dispatcher_.deferredDelete(std::move(transport_));
  }
}

void ProtocolEngine::init() {
  if (transport_) {
    transport_->close();
    dispatcher_.deferredDelete(std::move(transport_));
  }
  opened_.clear();
  closed_.clear();

  transport_ = transport_factory_(identity_.url);
  if (!transport_) {
    log_.error("No transport available for {}", identity_.url);
    return;
  }
  transport_->setCallbacks(*this);
  log_.debug("Opening transport to {}", identity_.url);
  transport_->open();
}

void ProtocolEngine::close() {
  if (transport_) {
    transport_->close();
  }
  opened_.clear();
  closed_.set();
}

void ProtocolEngine::send(const std::string& message) {
  if (!transport_ || !transport_->isOpen()) {
    log_.warning("Socket not open, dropping message: {}", message);
    return;
  }
  log_.debug("Sending: {}", message);
  transport_->send(message);
}

void ProtocolEngine::sendRaw(const std::string& command,
                             const std::vector<std::string>& args) {
  send(encodeCommand(identity_.zone, command, args));
}

void ProtocolEngine::sendJson(const std::string& command,
                              const nlohmann::json& data) {
  send(encodeJsonCommand(identity_.zone, command, data));
}

void ProtocolEngine::sendXml(const std::string& tag,
                             const std::string& action,
                             const std::string& room,
                             const std::string& body) {
  send(encodeXml(tag, action, room, body));
}

void ProtocolEngine::waitForDelimited(const std::string& command,
                                      MatchSpec match,
                                      ResponseCb cb,
                                      std::chrono::milliseconds timeout) {
  registerPending(
      std::make_unique<PendingRequest>(dispatcher_, command, std::move(match)),
      std::move(cb), timeout);
}

void ProtocolEngine::waitForXml(const std::string& tag,
                                const std::string& action,
                                const std::string& room,
                                ResponseCb cb,
                                std::chrono::milliseconds timeout) {
  registerPending(
      std::make_unique<PendingRequest>(dispatcher_, tag, action, room),
      std::move(cb), timeout);
}

void ProtocolEngine::registerPending(PendingRequestPtr request,
                                     ResponseCb cb,
                                     std::chrono::milliseconds timeout) {
  PendingRequest* raw = request.get();
  pending_.push_back(std::move(request));

  raw->completed().wait(timeout, [this, raw, cb](bool ok) {
    // On a match dispatchResponse() already unlinked the request and keeps
    // it alive for the duration of this callback. On timeout it is still
    // listed and owned here.
    PendingRequestPtr owned;
    auto it = std::find_if(
        pending_.begin(), pending_.end(),
        [raw](const PendingRequestPtr& p) { return p.get() == raw; });
    if (it != pending_.end()) {
      owned = std::move(*it);
      pending_.erase(it);
    }

    Result<ParsedResponse> result =
        (ok && raw->response())
            ? Result<ParsedResponse>(*raw->response())
            : makeError<ParsedResponse>(errors::kTimeout,
                                        "Timeout waiting for response");
    if (!ok) {
      log_.debug("Timeout waiting for {}", raw->describe());
    }
    if (owned) {
      // Still inside the request's own timer callback
      dispatcher_.deferredDelete(std::move(owned));
    }
    cb(std::move(result));
  });
}

void ProtocolEngine::failPending() {
  if (pending_.empty()) {
    return;
  }
  log_.debug("Failing {} pending requests", pending_.size());
  // Requests stay alive in the local list while their callbacks run
  std::list<PendingRequestPtr> failed;
  failed.swap(pending_);
  for (auto& request : failed) {
    request->completed().cancelWaiters();
  }
}

void ProtocolEngine::dispatchResponse(ParsedResponse response) {
  for (auto it = pending_.begin(); it != pending_.end(); ++it) {
    if ((*it)->matches(response)) {
      PendingRequestPtr matched = std::move(*it);
      pending_.erase(it);
      // The waiter may tear down this engine; only the local is used after
      matched->complete(std::move(response));
      return;
    }
  }
}

void ProtocolEngine::pingAndCheck() {
  log_.info("Login successful, checking connection...");
  connected_.set();
  ping();
  if (options_.housekeeping) {
    housekeeping_timer_->enableTimer(kHousekeepingDelay);
  }
  reconnect_attempts_ = 0;
  checkConnection();
}

void ProtocolEngine::ping() {
  if (!connected_.isSet()) {
    return;
  }
  sendRaw("pin", {"<RoundHouseKick>"});
  heartbeat_timer_->enableTimer(kHeartbeatInterval);
}

void ProtocolEngine::checkConnection() {
  if (!connected_.isSet()) {
    log_.warning("Socket is not connected, skipping connection check");
    stale_check_timer_->enableTimer(kStaleCheckDelay);
    return;
  }
  if (check_in_flight_) {
    return;
  }

  check_in_flight_ = true;
  waitForDelimited("gpi", MatchSpec::any(),
                   [this](Result<ParsedResponse> result) {
                     onCheckResult(result);
                   });
  sendJson("gpi", nlohmann::json::object());
}

void ProtocolEngine::onCheckResult(const Result<ParsedResponse>& result) {
  check_in_flight_ = false;
  if (!isError(result)) {
    check_timer_->enableTimer(kHealthCheckInterval);
    return;
  }
  log_.error(
      "Connection check failed, restarting socket in 10 seconds... ({})",
      getError(result).message);
  check_retry_timer_->enableTimer(kHealthRetryDelay);
}

void ProtocolEngine::disconnect(bool reconnect) {
  log_.info("Disconnecting from socket. Cleaning up resources...");
  connected_.clear();
  reconnect_ = reconnect;
  heartbeat_timer_->disableTimer();
  housekeeping_timer_->disableTimer();
  close();
}

std::chrono::seconds ProtocolEngine::backoffDelay(uint32_t attempt) {
  constexpr uint32_t table_size =
      sizeof(kBackoffTable) / sizeof(kBackoffTable[0]);
  if (attempt < table_size) {
    return std::chrono::seconds(kBackoffTable[attempt]);
  }
  return std::chrono::seconds(kBackoffCap);
}

void ProtocolEngine::restart() {
  const uint32_t attempt = reconnect_attempts_++;
  const int jitter = options_.jitter ? options_.jitter() : defaultJitter();
  const auto delay = backoffDelay(attempt) + std::chrono::seconds(jitter);

  log_.info("Restarting socket connection in {} seconds... (Total retries: {})",
            delay.count(), attempt);
  disconnect(false);
  reconnect_ = true;
  restart_timer_->enableTimer(
      std::chrono::duration_cast<std::chrono::milliseconds>(delay));
}

void ProtocolEngine::handleErrorResponse(const std::string& message,
                                         std::chrono::milliseconds delay) {
  log_.error("{}", message);
  error_retry_timer_->enableTimer(delay);
}

void ProtocolEngine::onOpen() {
  log_.debug("Socket opened");
  opened_.set();
}

void ProtocolEngine::onData(const std::string& message) {
  auto parsed = parseFrame(message);
  if (isError(parsed)) {
    log_.warning("Dropping frame: {}", getError(parsed).message);
    return;
  }
  dispatchResponse(std::move(get<ParsedResponse>(parsed)));
}

void ProtocolEngine::onError(const std::string& error) {
  log_.error("Error occurred in socket: {}", error);
  if (options_.auto_reconnect) {
    restart();
  }
}

void ProtocolEngine::onClose(int code, const std::string& reason) {
  log_.info("Socket closed with code: {} and reason: {}", code,
            reason.empty() ? "No reason provided" : reason);
  opened_.clear();
  closed_.set();
  disconnect(true);
}

}  // namespace protocol
}  // namespace realmlink
