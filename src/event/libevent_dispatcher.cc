#include "realmlink/event/libevent_dispatcher.h"

#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>

#define REALMLINK_LOG_COMPONENT "event"
#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace event {

namespace {

void ensureThreadingEnabled() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (evthread_use_pthreads() != 0) {
      throw std::runtime_error("libevent has no pthread support");
    }
  });
}

short watchedEvents(uint32_t events) {
  short flags = EV_PERSIST;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    flags |= EV_READ;
#ifdef EV_CLOSED
    flags |= EV_CLOSED;
#endif
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    flags |= EV_WRITE;
  }
  return flags;
}

uint32_t readyEvents(short flags) {
  uint32_t ready = 0;
  if (flags & EV_READ) {
    ready |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (flags & EV_WRITE) {
    ready |= static_cast<uint32_t>(FileReadyType::Write);
  }
#ifdef EV_CLOSED
  if (flags & EV_CLOSED) {
    ready |= static_cast<uint32_t>(FileReadyType::Closed);
  }
#endif
  return ready;
}

class LibeventFileEvent : public FileEvent {
 public:
  LibeventFileEvent(event_base* base, int fd, FileReadyCb cb)
      : base_(base), fd_(fd), cb_(std::move(cb)) {
    event_ = event_new(base_, fd_, 0, &LibeventFileEvent::onReady, this);
    if (!event_) {
      throw std::runtime_error("Failed to create file event");
    }
  }

  ~LibeventFileEvent() override { event_free(event_); }

  void setEnabled(uint32_t events) override {
    event_del(event_);
    if (events == 0) {
      return;
    }
    // The event is not pending after event_del(), so it may be reassigned
    event_assign(event_, base_, fd_, watchedEvents(events),
                 &LibeventFileEvent::onReady, this);
    event_add(event_, nullptr);
  }

 private:
  static void onReady(evutil_socket_t, short flags, void* arg) {
    auto* self = static_cast<LibeventFileEvent*>(arg);
    const uint32_t ready = readyEvents(flags);
    if (ready != 0) {
      // May destroy this file event
      self->cb_(ready);
    }
  }

  event_base* base_;
  int fd_;
  FileReadyCb cb_;
  struct event* event_;
};

class LibeventTimer : public Timer {
 public:
  LibeventTimer(event_base* base, TimerCb cb) : cb_(std::move(cb)) {
    event_ = evtimer_new(base, &LibeventTimer::onExpired, this);
    if (!event_) {
      throw std::runtime_error("Failed to create timer");
    }
  }

  ~LibeventTimer() override { event_free(event_); }

  void disableTimer() override { evtimer_del(event_); }

  void enableTimer(std::chrono::milliseconds duration) override {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
    evtimer_add(event_, &tv);
  }

  bool enabled() override { return evtimer_pending(event_, nullptr) != 0; }

 private:
  static void onExpired(evutil_socket_t, short, void* arg) {
    // May destroy this timer
    static_cast<LibeventTimer*>(arg)->cb_();
  }

  TimerCb cb_;
  struct event* event_;
};

class LibeventSignal : public SignalEvent {
 public:
  LibeventSignal(event_base* base, int signal_num, SignalCb cb)
      : cb_(std::move(cb)) {
    event_ = evsignal_new(base, signal_num, &LibeventSignal::onSignal, this);
    if (!event_ || evsignal_add(event_, nullptr) != 0) {
      if (event_) {
        event_free(event_);
      }
      throw std::runtime_error("Failed to listen for signal " +
                               std::to_string(signal_num));
    }
  }

  ~LibeventSignal() override { event_free(event_); }

 private:
  static void onSignal(evutil_socket_t, short, void* arg) {
    static_cast<LibeventSignal*>(arg)->cb_();
  }

  SignalCb cb_;
  struct event* event_;
};

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureThreadingEnabled();

  event_config* config = event_config_new();
  if (!config) {
    throw std::runtime_error("Failed to create event config");
  }
  event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
  base_ = event_base_new_with_config(config);
  event_config_free(config);
  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  post_event_ = event_new(base_, -1, 0, &LibeventDispatcher::onPosted, this);
  deferred_event_ =
      event_new(base_, -1, 0, &LibeventDispatcher::onDeferred, this);
  if (!post_event_ || !deferred_event_) {
    throw std::runtime_error("Failed to create dispatcher events");
  }

  REALMLINK_LOG(Debug, "Dispatcher {} using libevent {} ({})", name_,
                event_get_version(), event_base_get_method(base_));
}

LibeventDispatcher::~LibeventDispatcher() {
  // Deferred objects may still own events on this base
  while (!deferred_.empty()) {
    std::vector<DeferredDeletablePtr> doomed;
    doomed.swap(deferred_);
  }
  if (post_event_) {
    event_free(post_event_);
  }
  if (deferred_event_) {
    event_free(deferred_event_);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::post(PostCb callback) {
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    posted_.push_back(std::move(callback));
  }
  event_active(post_event_, EV_READ, 0);
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events) {
  auto file_event = std::make_unique<LibeventFileEvent>(base_, fd, std::move(cb));
  file_event->setEnabled(events);
  return file_event;
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<LibeventTimer>(base_, std::move(cb));
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  deferred_.push_back(std::move(to_delete));
  event_active(deferred_event_, EV_READ, 0);
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return std::make_unique<LibeventSignal>(base_, signal_num, std::move(cb));
}

void LibeventDispatcher::run() {
  exit_requested_ = false;
  REALMLINK_LOG(Debug, "Dispatcher {} running", name_);
  while (!exit_requested_) {
    if (event_base_loop(base_, EVLOOP_NO_EXIT_ON_EMPTY) < 0) {
      throw std::runtime_error("Event loop of " + name_ + " failed");
    }
  }
  // Callbacks posted after exit() still run before run() returns
  drainPosted();
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  // The post event breaks the loop from the loop thread, so an exit() that
  // races with loop startup is not lost
  event_active(post_event_, EV_READ, 0);
}

void LibeventDispatcher::drainPosted() {
  std::vector<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(posted_);
  }
  for (auto& callback : callbacks) {
    callback();
  }
}

void LibeventDispatcher::onPosted(evutil_socket_t, short, void* arg) {
  auto* self = static_cast<LibeventDispatcher*>(arg);
  self->drainPosted();
  if (self->exit_requested_) {
    event_base_loopbreak(self->base_);
  }
}

void LibeventDispatcher::onDeferred(evutil_socket_t, short, void* arg) {
  auto* self = static_cast<LibeventDispatcher*>(arg);
  // Destructors may defer further deletes; those land in the fresh list
  std::vector<DeferredDeletablePtr> doomed;
  doomed.swap(self->deferred_);
}

}  // namespace event
}  // namespace realmlink
