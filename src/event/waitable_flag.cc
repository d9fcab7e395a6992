#include "realmlink/event/waitable_flag.h"

#include <algorithm>

namespace realmlink {
namespace event {

WaitableFlag::WaitableFlag(Dispatcher& dispatcher) : dispatcher_(dispatcher) {}

WaitableFlag::~WaitableFlag() {
  // Pending waiters are dropped silently; their timers die with them
  for (auto& waiter : waiters_) {
    if (waiter->timer) {
      waiter->timer->disableTimer();
    }
  }
}

void WaitableFlag::set() {
  set_ = true;
  if (waiters_.empty()) {
    return;
  }

  std::list<WaiterPtr> released;
  released.swap(waiters_);
  for (auto& waiter : released) {
    if (waiter->timer) {
      waiter->timer->disableTimer();
    }
  }

  // The flag may be gone once the first callback runs. Only the local list
  // is used from here on.
  for (auto& waiter : released) {
    WaitCb cb = std::move(waiter->cb);
    cb(true);
  }
}

void WaitableFlag::cancelWaiters() {
  std::list<WaiterPtr> released;
  released.swap(waiters_);
  for (auto& waiter : released) {
    if (waiter->timer) {
      waiter->timer->disableTimer();
    }
  }
  for (auto& waiter : released) {
    WaitCb cb = std::move(waiter->cb);
    cb(false);
  }
}

void WaitableFlag::wait(std::chrono::milliseconds timeout, WaitCb cb) {
  if (set_) {
    cb(true);
    return;
  }
  if (timeout == std::chrono::milliseconds(0)) {
    cb(false);
    return;
  }

  auto waiter = std::make_unique<Waiter>();
  waiter->id = next_waiter_id_++;
  waiter->cb = std::move(cb);
  if (timeout > std::chrono::milliseconds(0)) {
    uint64_t id = waiter->id;
    waiter->timer =
        dispatcher_.createTimer([this, id]() { onWaiterTimeout(id); });
    waiter->timer->enableTimer(timeout);
  }
  waiters_.push_back(std::move(waiter));
}

void WaitableFlag::onWaiterTimeout(uint64_t id) {
  auto it = std::find_if(waiters_.begin(), waiters_.end(),
                         [id](const WaiterPtr& w) { return w->id == id; });
  if (it == waiters_.end()) {
    return;
  }

  WaiterPtr waiter = std::move(*it);
  waiters_.erase(it);
  WaitCb cb = std::move(waiter->cb);

  // We are inside the waiter's own timer callback
  dispatcher_.deferredDelete(std::move(waiter));
  cb(false);
}

}  // namespace event
}  // namespace realmlink
