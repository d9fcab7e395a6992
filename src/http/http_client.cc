#include "realmlink/http/http_client.h"

#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

#define REALMLINK_LOG_COMPONENT "http"
#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace http {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  std::string* response = static_cast<std::string*>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* headers =
      static_cast<std::unordered_map<std::string, std::string>*>(userdata);
  std::string header(buffer, size * nitems);

  size_t colon_pos = header.find(':');
  if (colon_pos != std::string::npos) {
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);

    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t\r\n") + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    if (!name.empty()) {
      (*headers)[name] = value;
    }
  }
  return size * nitems;
}

void initializeCurl() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

}  // namespace

class HttpClient::Impl {
 public:
  explicit Impl(const Config& config) : config_(config) {
    initializeCurl();
    worker_ = std::thread([this]() { workerLoop(); });
  }

  ~Impl() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  HttpResponse request(const HttpRequest& request) {
    auto start = std::chrono::steady_clock::now();
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
      response.status_code = -1;
      response.error = "Failed to initialize CURL";
      ++failed_requests_;
      return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    if (request.method == HttpMethod::POST) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(request.body.size()));
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header_pair : request.headers) {
      std::string header = header_pair.first + ": " + header_pair.second;
      headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const bool verify = config_.verify_ssl_certificates;
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
    if (!config_.ca_bundle_path.empty()) {
      curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION,
                     request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS,
                     static_cast<long>(request.max_redirects));

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config_.connection_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                     static_cast<long>(request.timeout.count()));

    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    if (res != CURLE_OK && response.status_code == 0) {
      response.status_code = -1;
    }
    response.body = std::move(response_body);

    if (res != CURLE_OK) {
      response.error = curl_easy_strerror(res);
      ++failed_requests_;
    }

    response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    ++total_requests_;
    total_latency_ms_ += response.latency.count();

    if (headers) {
      curl_slist_free_all(headers);
    }
    curl_easy_cleanup(curl);

    REALMLINK_LOG(Debug, "{} {} -> {} in {}ms",
                  request.method == HttpMethod::POST ? "POST" : "GET",
                  request.url,
                  response.status_code, response.latency.count());
    return response;
  }

  void requestAsync(const HttpRequest& request,
                    event::Dispatcher& dispatcher,
                    ResponseCallback callback) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      jobs_.push_back([this, request, &dispatcher, callback]() {
        auto response = std::make_shared<HttpResponse>(this->request(request));
        dispatcher.post([callback, response]() { callback(*response); });
      });
    }
    cv_.notify_one();
  }

  HttpClient::Stats stats() const {
    HttpClient::Stats stats;
    stats.total_requests = total_requests_;
    stats.failed_requests = failed_requests_;
    stats.avg_latency =
        total_requests_ > 0
            ? std::chrono::milliseconds(total_latency_ms_ / total_requests_)
            : std::chrono::milliseconds(0);
    return stats;
  }

 private:
  void workerLoop() {
    while (true) {
      std::function<void()> job;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
        if (stopping_) {
          return;
        }
        job = std::move(jobs_.front());
        jobs_.pop_front();
      }
      job();
    }
  }

  Config config_;
  std::atomic<size_t> total_requests_{0};
  std::atomic<size_t> failed_requests_{0};
  std::atomic<long long> total_latency_ms_{0};

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  bool stopping_{false};
  std::thread worker_;
};

HttpClient::HttpClient() : HttpClient(Config{}) {}

HttpClient::HttpClient(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::request(const HttpRequest& request) {
  return impl_->request(request);
}

void HttpClient::requestAsync(const HttpRequest& request,
                              event::Dispatcher& dispatcher,
                              ResponseCallback callback) {
  impl_->requestAsync(request, dispatcher, std::move(callback));
}

HttpResponse HttpClient::get(const std::string& url,
                             std::chrono::seconds timeout) {
  HttpRequest request;
  request.url = url;
  request.timeout = timeout;
  return impl_->request(request);
}

HttpClient::Stats HttpClient::stats() const { return impl_->stats(); }

}  // namespace http
}  // namespace realmlink
