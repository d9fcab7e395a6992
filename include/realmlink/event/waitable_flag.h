#ifndef REALMLINK_EVENT_WAITABLE_FLAG_H
#define REALMLINK_EVENT_WAITABLE_FLAG_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>

#include "realmlink/event/event_loop.h"

namespace realmlink {
namespace event {

/**
 * Boolean signal with timeout-bounded waits, driven by a dispatcher.
 *
 * wait() never blocks the loop; the callback receives true when the flag is
 * (or becomes) set and false when the timeout elapses first. A single set()
 * releases every current waiter. clear() resets the flag without touching
 * waiters.
 *
 * Waiter callbacks may destroy the flag itself. Neither set() nor a timeout
 * touches the flag after the first callback has been invoked.
 */
class WaitableFlag {
 public:
  using WaitCb = std::function<void(bool)>;

  // Wait forever
  static constexpr std::chrono::milliseconds kNoTimeout{-1};

  explicit WaitableFlag(Dispatcher& dispatcher);
  ~WaitableFlag();

  WaitableFlag(const WaitableFlag&) = delete;
  WaitableFlag& operator=(const WaitableFlag&) = delete;

  void set();
  void clear() { set_ = false; }
  bool isSet() const { return set_; }

  // Release every current waiter with false, as if its timeout had elapsed
  void cancelWaiters();

  void wait(std::chrono::milliseconds timeout, WaitCb cb);

  size_t waiterCount() const { return waiters_.size(); }

 private:
  struct Waiter : public DeferredDeletable {
    uint64_t id{0};
    WaitCb cb;
    TimerPtr timer;
  };
  using WaiterPtr = std::unique_ptr<Waiter>;

  void onWaiterTimeout(uint64_t id);

  Dispatcher& dispatcher_;
  bool set_{false};
  uint64_t next_waiter_id_{1};
  std::list<WaiterPtr> waiters_;
};

}  // namespace event
}  // namespace realmlink

#endif  // REALMLINK_EVENT_WAITABLE_FLAG_H
