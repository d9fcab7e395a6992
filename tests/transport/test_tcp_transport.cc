#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "realmlink/event/libevent_dispatcher.h"
#include "realmlink/transport/tcp_transport.h"
#include "realmlink/transport/transport_factory.h"

namespace realmlink {
namespace transport {
namespace {

using std::chrono::milliseconds;

class RecordingCallbacks : public TransportCallbacks {
 public:
  void onOpen() override { ++opened; }
  void onData(const std::string& message) override {
    messages.push_back(message);
    if (on_data) {
      on_data(message);
    }
  }
  void onError(const std::string& error) override { errors.push_back(error); }
  void onClose(int code, const std::string&) override {
    close_codes.push_back(code);
    if (on_close) {
      on_close();
    }
  }

  int opened{0};
  std::vector<std::string> messages;
  std::vector<std::string> errors;
  std::vector<int> close_codes;
  std::function<void(const std::string&)> on_data;
  std::function<void()> on_close;
};

/**
 * Loopback tests on the libevent dispatcher. A blocking peer runs on its
 * own thread; the dispatcher runs on the test thread until exit().
 */
class TcpTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ =
        std::make_unique<event::LibeventDispatcher>("tcp_transport_test");

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listen_fd_, 0);
    int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr),
                     sizeof(addr)),
              0);
    ASSERT_EQ(::listen(listen_fd_, 1), 0);
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    guard_ = dispatcher_->createTimer([this]() {
      timed_out_ = true;
      dispatcher_->exit();
    });
    guard_->enableTimer(milliseconds(5000));
  }

  void TearDown() override {
    if (peer_.joinable()) {
      peer_.join();
    }
    guard_.reset();
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
    }
    dispatcher_.reset();
  }

  void runPeer(std::function<void(int)> script) {
    peer_ = std::thread([this, script]() {
      int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) {
        return;
      }
      script(fd);
      ::close(fd);
    });
  }

  static std::string readUntilNul(int fd) {
    std::string out;
    char c;
    while (::recv(fd, &c, 1, 0) == 1) {
      if (c == '\0') {
        return out;
      }
      out.push_back(c);
    }
    return out;
  }

  std::string address() const {
    return "127.0.0.1:" + std::to_string(port_);
  }

  std::unique_ptr<event::LibeventDispatcher> dispatcher_;
  event::TimerPtr guard_;
  int listen_fd_{-1};
  uint16_t port_{0};
  std::thread peer_;
  bool timed_out_{false};
};

TEST_F(TcpTransportTest, SplitsInboundStreamOnNul) {
  runPeer([](int fd) {
    const std::string first("%xt%a%1%0%\0%xt%b%1", 18);
    const std::string second("%0%\0", 4);
    ::send(fd, first.data(), first.size(), 0);
    std::this_thread::sleep_for(milliseconds(50));
    ::send(fd, second.data(), second.size(), 0);
    std::this_thread::sleep_for(milliseconds(50));
  });

  auto transport = createTcpTransportFactory(*dispatcher_)(address());
  ASSERT_NE(transport, nullptr);
  RecordingCallbacks callbacks;
  callbacks.on_close = [this]() { dispatcher_->exit(); };
  transport->setCallbacks(callbacks);
  transport->open();
  dispatcher_->run();

  EXPECT_FALSE(timed_out_);
  EXPECT_EQ(callbacks.opened, 1);
  ASSERT_EQ(callbacks.messages.size(), 2u);
  EXPECT_EQ(callbacks.messages[0], "%xt%a%1%0%");
  EXPECT_EQ(callbacks.messages[1], "%xt%b%1%0%");
  EXPECT_EQ(callbacks.close_codes, std::vector<int>({kCloseAbnormal}));
}

TEST_F(TcpTransportTest, TerminatesOutboundMessagesWithNul) {
  std::string received;
  runPeer([&received](int fd) { received = readUntilNul(fd); });

  auto transport =
      createTcpTransportFactory(*dispatcher_)("wss://" + address());
  ASSERT_NE(transport, nullptr);
  RecordingCallbacks callbacks;
  callbacks.on_close = [this]() { dispatcher_->exit(); };
  transport->setCallbacks(callbacks);
  transport->open();

  // Send once connected; the peer closes after reading one message
  auto sender = dispatcher_->createTimer([&transport]() {
    transport->send("<msg t='sys'><body action='verChk' r='0'></body></msg>");
  });
  sender->enableTimer(milliseconds(100));
  dispatcher_->run();
  peer_.join();

  EXPECT_FALSE(timed_out_);
  EXPECT_EQ(received, "<msg t='sys'><body action='verChk' r='0'></body></msg>");
}

TEST_F(TcpTransportTest, ConnectionRefusedReportsErrorThenClose) {
  ::close(listen_fd_);
  listen_fd_ = -1;

  auto transport = createTcpTransportFactory(*dispatcher_)(address());
  RecordingCallbacks callbacks;
  callbacks.on_close = [this]() { dispatcher_->exit(); };
  transport->setCallbacks(callbacks);
  transport->open();
  dispatcher_->run();

  EXPECT_FALSE(timed_out_);
  EXPECT_EQ(callbacks.opened, 0);
  EXPECT_EQ(callbacks.errors.size(), 1u);
  EXPECT_EQ(callbacks.close_codes, std::vector<int>({kCloseAbnormal}));
}

TEST_F(TcpTransportTest, OwnerCloseRaisesNothing) {
  runPeer([](int fd) { readUntilNul(fd); });

  auto transport = createTcpTransportFactory(*dispatcher_)(address());
  RecordingCallbacks callbacks;
  transport->setCallbacks(callbacks);
  transport->open();

  auto closer = dispatcher_->createTimer([&]() {
    EXPECT_TRUE(transport->isOpen());
    transport->close();
  });
  closer->enableTimer(milliseconds(100));
  auto stopper = dispatcher_->createTimer([this]() { dispatcher_->exit(); });
  stopper->enableTimer(milliseconds(300));
  dispatcher_->run();

  EXPECT_FALSE(transport->isOpen());
  EXPECT_TRUE(callbacks.errors.empty());
  EXPECT_TRUE(callbacks.close_codes.empty());
}

}  // namespace
}  // namespace transport
}  // namespace realmlink
