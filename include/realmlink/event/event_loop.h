#ifndef REALMLINK_EVENT_EVENT_LOOP_H
#define REALMLINK_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace realmlink {
namespace event {

class FileEvent;
class Timer;
class SignalEvent;
class DeferredDeletable;

using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;
using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

// Readiness bits handed to a FileReadyCb
enum class FileReadyType : uint32_t {
  Read = 0x01,
  Write = 0x02,
  // Peer hung up; reported together with Read where the backend knows it
  Closed = 0x04
};

/**
 * Base for objects released through Dispatcher::deferredDelete(), typically
 * from inside one of their own callbacks.
 */
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

// Level-triggered readiness watch on a descriptor
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  // Replace the watched FileReadyType bits; zero stops watching
  virtual void setEnabled(uint32_t events) = 0;
};

/**
 * One-shot timer. Enabling an armed timer moves its deadline. Destroying
 * the timer cancels it.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
  virtual bool enabled() = 0;
};

// Signal subscription; unsubscribes on destruction
class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * Single-threaded event loop driving every connection: socket I/O,
 * heartbeats, health checks, reconnect backoff and correlated waits all run
 * on it, so per-connection state needs no locking.
 *
 * post() and exit() may be called from any thread. Everything else belongs
 * to the loop thread.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  // Run the callback on the loop thread, in posting order
  virtual void post(PostCb callback) = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  // Destroy the object on a later loop iteration
  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  // Block in the loop until exit() is called
  virtual void run() = 0;

  virtual void exit() = 0;
};

}  // namespace event
}  // namespace realmlink

#endif  // REALMLINK_EVENT_EVENT_LOOP_H
