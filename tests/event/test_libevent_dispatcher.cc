#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "realmlink/event/libevent_dispatcher.h"
#include "realmlink/event/waitable_flag.h"

namespace realmlink {
namespace event {
namespace {

using std::chrono::milliseconds;

class LibeventDispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = std::make_unique<LibeventDispatcher>("dispatcher_test");

    // Keeps a broken test from hanging the run
    guard_ = dispatcher_->createTimer([this]() {
      timed_out_ = true;
      dispatcher_->exit();
    });
    guard_->enableTimer(milliseconds(5000));
  }

  void TearDown() override {
    guard_.reset();
    dispatcher_.reset();
  }

  void run() {
    dispatcher_->run();
    EXPECT_FALSE(timed_out_);
  }

  std::unique_ptr<LibeventDispatcher> dispatcher_;
  TimerPtr guard_;
  bool timed_out_{false};
};

class Tracked : public DeferredDeletable {
 public:
  explicit Tracked(bool& deleted) : deleted_(deleted) {}
  ~Tracked() override { deleted_ = true; }

 private:
  bool& deleted_;
};

TEST_F(LibeventDispatcherTest, PostRunsInOrder) {
  std::vector<int> order;
  dispatcher_->post([&order]() { order.push_back(1); });
  dispatcher_->post([&order]() { order.push_back(2); });
  dispatcher_->post([this]() { dispatcher_->exit(); });
  run();
  EXPECT_EQ(std::vector<int>({1, 2}), order);
}

TEST_F(LibeventDispatcherTest, PostFromAnotherThreadWakesTheLoop) {
  const std::thread::id loop_thread = std::this_thread::get_id();
  std::atomic<bool> ran{false};
  std::thread poster([this, &ran, loop_thread]() {
    std::this_thread::sleep_for(milliseconds(50));
    dispatcher_->post([this, &ran, loop_thread]() {
      ran = true;
      EXPECT_EQ(loop_thread, std::this_thread::get_id());
      dispatcher_->exit();
    });
  });
  run();
  poster.join();
  EXPECT_TRUE(ran);
}

TEST_F(LibeventDispatcherTest, ExitFromAnotherThreadStopsTheLoop) {
  std::thread stopper([this]() {
    std::this_thread::sleep_for(milliseconds(50));
    dispatcher_->exit();
  });
  run();
  stopper.join();
}

TEST_F(LibeventDispatcherTest, ExitBeforeRunIsNotLost) {
  // Posted ahead of run(), so the exit lands during loop startup
  dispatcher_->post([this]() { dispatcher_->exit(); });
  run();
}

TEST_F(LibeventDispatcherTest, RearmingTimerMovesDeadline) {
  int fired = 0;
  auto timer = dispatcher_->createTimer([&fired, this]() {
    ++fired;
    dispatcher_->exit();
  });
  timer->enableTimer(milliseconds(20));
  timer->enableTimer(milliseconds(80));
  const auto start = std::chrono::steady_clock::now();
  run();
  EXPECT_EQ(1, fired);
  EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(70));
}

TEST_F(LibeventDispatcherTest, TimersFireInDeadlineOrder) {
  std::vector<int> order;
  auto late = dispatcher_->createTimer([&order, this]() {
    order.push_back(2);
    dispatcher_->exit();
  });
  auto early = dispatcher_->createTimer([&order]() { order.push_back(1); });
  late->enableTimer(milliseconds(60));
  early->enableTimer(milliseconds(20));
  EXPECT_TRUE(late->enabled());
  run();
  EXPECT_EQ(std::vector<int>({1, 2}), order);
  EXPECT_FALSE(late->enabled());
}

TEST_F(LibeventDispatcherTest, DisabledTimerNeverFires) {
  bool fired = false;
  auto timer = dispatcher_->createTimer([&fired]() { fired = true; });
  timer->enableTimer(milliseconds(10));
  timer->disableTimer();
  auto stop = dispatcher_->createTimer([this]() { dispatcher_->exit(); });
  stop->enableTimer(milliseconds(50));
  run();
  EXPECT_FALSE(fired);
}

TEST_F(LibeventDispatcherTest, DeferredDeleteHappensOnLaterIteration) {
  bool deleted = false;
  dispatcher_->post([this, &deleted]() {
    dispatcher_->deferredDelete(std::make_unique<Tracked>(deleted));
    EXPECT_FALSE(deleted);
    auto stop = [this]() { dispatcher_->exit(); };
    dispatcher_->post(stop);
  });
  run();
  EXPECT_TRUE(deleted);
}

TEST_F(LibeventDispatcherTest, WaitableFlagTimesOutOnRealClock) {
  WaitableFlag flag(*dispatcher_);
  bool result = true;
  const auto start = std::chrono::steady_clock::now();
  flag.wait(milliseconds(30), [this, &result](bool set) {
    result = set;
    dispatcher_->exit();
  });
  run();
  EXPECT_FALSE(result);
  EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(25));
}

TEST_F(LibeventDispatcherTest, SignalCallbackRunsOnLoop) {
  bool received = false;
  auto signal_event = dispatcher_->listenForSignal(SIGUSR1, [&received, this]() {
    received = true;
    dispatcher_->exit();
  });
  dispatcher_->post([]() { ::kill(::getpid(), SIGUSR1); });
  run();
  EXPECT_TRUE(received);
}

}  // namespace
}  // namespace event
}  // namespace realmlink
