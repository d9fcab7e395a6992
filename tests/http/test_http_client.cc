#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "realmlink/event/libevent_dispatcher.h"
#include "realmlink/http/http_client.h"

namespace realmlink {
namespace http {
namespace {

/**
 * One-shot HTTP server on loopback: accepts a single connection, reads the
 * request head and writes a canned response.
 */
class OneShotServer {
 public:
  explicit OneShotServer(std::string response) : response_(std::move(response)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this]() {
      int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        return;
      }
      char buf[4096];
      std::string request;
      while (request.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(client, buf, sizeof(buf), 0);
        if (n <= 0) {
          break;
        }
        request.append(buf, static_cast<size_t>(n));
      }
      request_line_ = request.substr(0, request.find("\r\n"));
      ::send(client, response_.data(), response_.size(), 0);
      ::close(client);
    });
  }

  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(fd_);
  }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  void join() { thread_.join(); }
  const std::string& requestLine() const { return request_line_; }

 private:
  std::string response_;
  int fd_{-1};
  uint16_t port_{0};
  std::thread thread_;
  std::string request_line_;
};

const char kFeedResponse[] =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: application/xml\r\n"
    "Content-Length: 19\r\n"
    "Connection: close\r\n"
    "\r\n"
    "<network></network>";

TEST(HttpClientTest, SynchronousGet) {
  OneShotServer server(kFeedResponse);
  HttpClient client;

  HttpResponse response = client.get(server.url("/config/network/1.xml"));
  server.join();

  EXPECT_TRUE(response.ok());
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, "<network></network>");
  EXPECT_EQ(response.headers["Content-Type"], "application/xml");
  EXPECT_EQ(server.requestLine(), "GET /config/network/1.xml HTTP/1.1");
  EXPECT_EQ(client.stats().total_requests, 1u);
}

TEST(HttpClientTest, NotFoundIsNotOk) {
  OneShotServer server(
      "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n"
      "Connection: close\r\n\r\n");
  HttpClient client;
  HttpResponse response = client.get(server.url("/missing.xml"));
  EXPECT_EQ(response.status_code, 404);
  EXPECT_TRUE(response.error.empty());
  EXPECT_FALSE(response.ok());
}

TEST(HttpClientTest, ConnectionFailureReportsError) {
  HttpClient client;
  // Port 1 on loopback is not expected to accept connections
  HttpResponse response =
      client.get("http://127.0.0.1:1/feed.xml", std::chrono::seconds(5));
  EXPECT_EQ(response.status_code, -1);
  EXPECT_FALSE(response.error.empty());
  EXPECT_EQ(client.stats().failed_requests, 1u);
}

TEST(HttpClientTest, AsyncCompletesOnDispatcher) {
  OneShotServer server(kFeedResponse);
  auto dispatcher = std::make_unique<event::LibeventDispatcher>("http_test");
  const std::thread::id loop_thread = std::this_thread::get_id();
  HttpClient client;

  bool done = false;
  bool on_dispatcher = false;
  HttpRequest request;
  request.url = server.url("/e4k.xml");
  client.requestAsync(request, *dispatcher, [&](HttpResponse response) {
    done = response.ok();
    on_dispatcher = std::this_thread::get_id() == loop_thread;
    dispatcher->exit();
  });

  auto guard = dispatcher->createTimer([&]() { dispatcher->exit(); });
  guard->enableTimer(std::chrono::milliseconds(5000));
  dispatcher->run();

  EXPECT_TRUE(done);
  EXPECT_TRUE(on_dispatcher);
}

}  // namespace
}  // namespace http
}  // namespace realmlink
