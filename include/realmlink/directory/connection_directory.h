/**
 * @file connection_directory.h
 * @brief Zone-keyed registry of game server connections
 *
 * Discovers servers from the remote feeds, keeps one login machine per
 * allow-listed zone with complete credentials, and lets the gateway add and
 * remove temporary live servers at runtime.
 */

#ifndef REALMLINK_DIRECTORY_CONNECTION_DIRECTORY_H
#define REALMLINK_DIRECTORY_CONNECTION_DIRECTORY_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "realmlink/client/login_machine.h"
#include "realmlink/config/app_config.h"
#include "realmlink/config/data_files.h"
#include "realmlink/core/result.h"
#include "realmlink/directory/server_feed.h"
#include "realmlink/event/event_loop.h"
#include "realmlink/http/http_client.h"
#include "realmlink/transport/transport.h"

namespace realmlink {
namespace directory {

constexpr std::chrono::seconds kFeedTimeout{60};

using FeedCallback = std::function<void(Result<std::string>)>;
// Fetches a feed document; the callback runs on the dispatcher thread
using FeedFetcher =
    std::function<void(const std::string& url, FeedCallback callback)>;

// Feed fetcher backed by the HTTP client with the 60 second feed timeout
FeedFetcher makeHttpFeedFetcher(http::HttpClient& client,
                                event::Dispatcher& dispatcher);

struct DirectoryOptions {
  // Transports for ws://, wss:// and tcp:// URLs
  transport::TransportFactory transports;
  // Transports for the raw-stream variant
  transport::TransportFactory stream_transports;
  bool housekeeping{false};
  // Backoff jitter handed to every engine; empty for random
  std::function<int()> jitter;
};

class ConnectionDirectory {
 public:
  ConnectionDirectory(event::Dispatcher& dispatcher,
                      config::DataFiles data,
                      FeedFetcher fetcher,
                      DirectoryOptions options);
  ~ConnectionDirectory();

  ConnectionDirectory(const ConnectionDirectory&) = delete;
  ConnectionDirectory& operator=(const ConnectionDirectory&) = delete;

  /**
   * Fetch the feeds one after another and register their servers. done
   * runs once every feed has been processed; a feed that fails to download
   * or parse is logged and skipped.
   */
  void discover(const std::vector<config::FeedConfig>& feeds,
                std::function<void()> done);

  /**
   * Register the servers of one parsed feed. Zones that are not allowed or
   * lack credentials are skipped. Returns the number registered.
   */
  size_t addServers(const config::FeedConfig& feed,
                    const std::vector<ServerDescriptor>& servers);

  // Start the connect routine of every connection
  void connectAll();

  // Restart every connection with backoff
  void restartAll();

  /**
   * Register and start a temporary live server at wss://<host>. An existing
   * connection for the zone is closed and replaced.
   */
  client::LoginMachine& addLive(const std::string& zone,
                                const std::string& host,
                                const std::string& username,
                                const std::string& password);

  // Close and forget a connection. False when the zone is unknown.
  bool remove(const std::string& zone);

  client::LoginMachine* find(const std::string& zone);

  // Zone -> connected
  std::map<std::string, bool> status() const;

  size_t size() const { return connections_.size(); }
  std::vector<std::string> zones() const;
  const config::DataFiles& data() const { return data_; }

 private:
  void fetchNext(std::shared_ptr<std::vector<config::FeedConfig>> feeds,
                 size_t index,
                 std::function<void()> done);
  void onFeed(const config::FeedConfig& feed, const Result<std::string>& body);
  client::LoginMachinePtr createMachine(const config::FeedConfig& feed,
                                        const ServerDescriptor& server,
                                        const config::Credentials& creds);
  void replace(const std::string& zone, client::LoginMachinePtr machine);

  event::Dispatcher& dispatcher_;
  config::DataFiles data_;
  FeedFetcher fetcher_;
  DirectoryOptions options_;
  std::map<std::string, client::LoginMachinePtr> connections_;
  // Guards callbacks that outlive the directory
  std::shared_ptr<bool> alive_;
};

}  // namespace directory
}  // namespace realmlink

#endif  // REALMLINK_DIRECTORY_CONNECTION_DIRECTORY_H
