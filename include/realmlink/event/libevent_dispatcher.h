#ifndef REALMLINK_EVENT_LIBEVENT_DISPATCHER_H
#define REALMLINK_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "realmlink/event/event_loop.h"

struct event_base;
struct event;

namespace realmlink {
namespace event {

/**
 * Dispatcher on a libevent event_base.
 *
 * Cross-thread post() and exit() rely on libevent's pthread locking, which
 * is switched on before the first base is created. Posted callbacks and
 * deferred deletes are drained from two internal user events that are
 * activated with event_active().
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  LibeventDispatcher(const LibeventDispatcher&) = delete;
  LibeventDispatcher& operator=(const LibeventDispatcher&) = delete;

  void post(PostCb callback) override;
  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  void deferredDelete(DeferredDeletablePtr&& to_delete) override;
  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;
  void run() override;
  void exit() override;

  // For libevent add-ons sharing the loop (evhttp)
  event_base* base() { return base_; }

 private:
  static void onPosted(int fd, short events, void* arg);
  static void onDeferred(int fd, short events, void* arg);

  void drainPosted();

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::vector<PostCb> posted_;
  struct event* post_event_{nullptr};

  std::vector<DeferredDeletablePtr> deferred_;
  struct event* deferred_event_{nullptr};
};

}  // namespace event
}  // namespace realmlink

#endif  // REALMLINK_EVENT_LIBEVENT_DISPATCHER_H
