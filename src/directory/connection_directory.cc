#define REALMLINK_LOG_COMPONENT "directory"

#include "realmlink/directory/connection_directory.h"

#include <fmt/format.h>

#include "realmlink/client/live_server_login.h"
#include "realmlink/client/multi_realm_login.h"
#include "realmlink/client/single_realm_login.h"
#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace directory {

FeedFetcher makeHttpFeedFetcher(http::HttpClient& client,
                                event::Dispatcher& dispatcher) {
  return [&client, &dispatcher](const std::string& url, FeedCallback callback) {
    http::HttpRequest request;
    request.url = url;
    request.timeout = kFeedTimeout;
    client.requestAsync(
        request, dispatcher, [url, callback](http::HttpResponse response) {
          if (!response.error.empty()) {
            callback(makeError<std::string>(errors::kIoError, response.error));
          } else if (!response.ok()) {
            callback(makeError<std::string>(
                errors::kUnexpectedStatus,
                fmt::format("HTTP {} from {}", response.status_code, url)));
          } else {
            callback(Result<std::string>(std::move(response.body)));
          }
        });
  };
}

ConnectionDirectory::ConnectionDirectory(event::Dispatcher& dispatcher,
                                         config::DataFiles data,
                                         FeedFetcher fetcher,
                                         DirectoryOptions options)
    : dispatcher_(dispatcher),
      data_(std::move(data)),
      fetcher_(std::move(fetcher)),
      options_(std::move(options)),
      alive_(std::make_shared<bool>(true)) {}

ConnectionDirectory::~ConnectionDirectory() {
  *alive_ = false;
  for (auto& entry : connections_) {
    entry.second->close();
  }
}

void ConnectionDirectory::discover(const std::vector<config::FeedConfig>& feeds,
                                   std::function<void()> done) {
  auto list = std::make_shared<std::vector<config::FeedConfig>>(feeds);
  fetchNext(list, 0, std::move(done));
}

void ConnectionDirectory::fetchNext(
    std::shared_ptr<std::vector<config::FeedConfig>> feeds,
    size_t index,
    std::function<void()> done) {
  if (index >= feeds->size()) {
    REALMLINK_LOG(Info, "Discovery finished: {} connections", size());
    if (done) {
      done();
    }
    return;
  }

  const config::FeedConfig& feed = (*feeds)[index];
  REALMLINK_LOG(Info, "[{}] Fetching server list from {}", feed.name,
                feed.url);
  std::weak_ptr<bool> alive = alive_;
  fetcher_(feed.url, [this, alive, feeds, index,
                      done](Result<std::string> body) {
    auto guard = alive.lock();
    if (!guard || !*guard) {
      return;
    }
    onFeed((*feeds)[index], body);
    fetchNext(feeds, index + 1, done);
  });
}

void ConnectionDirectory::onFeed(const config::FeedConfig& feed,
                                 const Result<std::string>& body) {
  if (isError(body)) {
    REALMLINK_LOG(Error, "[{}] Failed to fetch server list: {}", feed.name,
                  getError(body).message);
    return;
  }
  auto servers = parseServerFeed(getValue(body));
  if (isError(servers)) {
    REALMLINK_LOG(Error, "[{}] Failed to parse server list: {}", feed.name,
                  getError(servers).message);
    return;
  }
  const size_t added = addServers(feed, getValue(servers));
  REALMLINK_LOG(Info, "[{}] {} of {} servers registered", feed.name, added,
                getValue(servers).size());
}

size_t ConnectionDirectory::addServers(
    const config::FeedConfig& feed,
    const std::vector<ServerDescriptor>& servers) {
  size_t added = 0;
  for (const auto& server : servers) {
    if (!data_.isAllowed(server.zone)) {
      REALMLINK_LOG(Debug, "[{}] Not in allowed instances", server.zone);
      continue;
    }
    if (!server.enabled) {
      REALMLINK_LOG(Info, "[{}] Disabled in the {} feed", server.zone,
                    feed.name);
      continue;
    }
    auto creds = data_.credentialsFor(server.zone);
    if (!creds) {
      REALMLINK_LOG(Error, "[{}] Error: no user found", server.zone);
      continue;
    }
    REALMLINK_LOG(Info, "[{}] Matching server found: creating socket...",
                  server.zone);
    replace(server.zone, createMachine(feed, server, *creds));
    ++added;
  }
  return added;
}

client::LoginMachinePtr ConnectionDirectory::createMachine(
    const config::FeedConfig& feed,
    const ServerDescriptor& server,
    const config::Credentials& creds) {
  protocol::EngineOptions engine_options;
  engine_options.housekeeping = options_.housekeeping;
  engine_options.jitter = options_.jitter;

  protocol::ConnectionIdentity identity;
  identity.zone = server.zone;
  identity.url = feed.scheme + "://" + server.server;

  switch (feed.variant) {
    case config::FeedVariant::SingleRealm:
      identity.type = protocol::ServerType::EP;
      return std::make_unique<client::SingleRealmLogin>(
          dispatcher_, std::move(identity), creds, options_.transports,
          std::move(engine_options));
    case config::FeedVariant::MultiRealm:
      identity.type = protocol::ServerType::E4K;
      return std::make_unique<client::MultiRealmLogin>(
          dispatcher_, std::move(identity), creds, options_.transports,
          std::move(engine_options));
    case config::FeedVariant::MultiRealmTcp:
      identity.type = protocol::ServerType::E4K;
      identity.url = "tcp://" + server.server;
      return std::make_unique<client::MultiRealmLogin>(
          dispatcher_, std::move(identity), creds, options_.stream_transports,
          std::move(engine_options));
  }
  return nullptr;
}

void ConnectionDirectory::replace(const std::string& zone,
                                  client::LoginMachinePtr machine) {
  auto it = connections_.find(zone);
  if (it != connections_.end()) {
    REALMLINK_LOG(Info, "[{}] Replacing existing connection", zone);
    it->second->close();
    dispatcher_.deferredDelete(std::move(it->second));
    it->second = std::move(machine);
    return;
  }
  connections_.emplace(zone, std::move(machine));
}

void ConnectionDirectory::connectAll() {
  for (auto& entry : connections_) {
    entry.second->connect();
  }
}

void ConnectionDirectory::restartAll() {
  REALMLINK_LOG(Info, "Restarting {} connections", connections_.size());
  for (auto& entry : connections_) {
    entry.second->restart();
  }
}

client::LoginMachine& ConnectionDirectory::addLive(
    const std::string& zone,
    const std::string& host,
    const std::string& username,
    const std::string& password) {
  config::Credentials creds{username, password, zone};
  auto machine = std::make_unique<client::LiveServerLogin>(
      dispatcher_, zone, "wss://" + host, std::move(creds),
      options_.transports);
  client::LoginMachine& ref = *machine;
  replace(zone, std::move(machine));
  ref.connect();
  return ref;
}

bool ConnectionDirectory::remove(const std::string& zone) {
  auto it = connections_.find(zone);
  if (it == connections_.end()) {
    return false;
  }
  it->second->close();
  dispatcher_.deferredDelete(std::move(it->second));
  connections_.erase(it);
  REALMLINK_LOG(Info, "[{}] Connection removed", zone);
  return true;
}

client::LoginMachine* ConnectionDirectory::find(const std::string& zone) {
  auto it = connections_.find(zone);
  return it == connections_.end() ? nullptr : it->second.get();
}

std::map<std::string, bool> ConnectionDirectory::status() const {
  std::map<std::string, bool> result;
  for (const auto& entry : connections_) {
    result[entry.first] = entry.second->isConnected();
  }
  return result;
}

std::vector<std::string> ConnectionDirectory::zones() const {
  std::vector<std::string> result;
  result.reserve(connections_.size());
  for (const auto& entry : connections_) {
    result.push_back(entry.first);
  }
  return result;
}

}  // namespace directory
}  // namespace realmlink
