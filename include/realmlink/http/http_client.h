#ifndef REALMLINK_HTTP_HTTP_CLIENT_H
#define REALMLINK_HTTP_HTTP_CLIENT_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "realmlink/event/event_loop.h"

/**
 * @file http_client.h
 * @brief libcurl client used to fetch the server-list feeds
 */

namespace realmlink {
namespace http {

enum class HttpMethod { GET, POST };

struct HttpResponse {
  int status_code{0};  // -1 when the request never got a response
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  std::string error;  // set when the transfer failed
  std::chrono::milliseconds latency{0};

  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }
};

struct HttpRequest {
  std::string url;
  HttpMethod method{HttpMethod::GET};
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{60};
  bool follow_redirects{true};
  int max_redirects{10};
};

class HttpClient {
 public:
  using ResponseCallback = std::function<void(HttpResponse)>;

  struct Config {
    std::chrono::seconds connection_timeout{10};
    bool verify_ssl_certificates{true};
    std::string ca_bundle_path;
    std::string user_agent{"realmlink/1.0"};
  };

  HttpClient();
  explicit HttpClient(const Config& config);

  // Joins the worker; queued requests that have not started are dropped
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Blocking transfer on the calling thread
  HttpResponse request(const HttpRequest& request);

  /**
   * Run the transfer on the client's worker thread and post the callback
   * to the dispatcher. The dispatcher must outlive the request.
   */
  void requestAsync(const HttpRequest& request,
                    event::Dispatcher& dispatcher,
                    ResponseCallback callback);

  HttpResponse get(const std::string& url,
                   std::chrono::seconds timeout = std::chrono::seconds(60));

  struct Stats {
    size_t total_requests;
    size_t failed_requests;
    std::chrono::milliseconds avg_latency;
  };

  Stats stats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace http
}  // namespace realmlink

#endif  // REALMLINK_HTTP_HTTP_CLIENT_H
