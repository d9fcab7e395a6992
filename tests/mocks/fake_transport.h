#pragma once

#include <functional>
#include <string>
#include <vector>

#include "realmlink/event/event_loop.h"
#include "realmlink/transport/transport.h"

namespace realmlink {
namespace test {

/**
 * In-memory transport. Records outbound messages and lets the test raise
 * the four transport events by hand. Replies queued with reply() are
 * delivered through the dispatcher, like real socket reads.
 */
class FakeTransport : public transport::Transport {
 public:
  FakeTransport(event::Dispatcher& dispatcher, const std::string& url)
      : dispatcher_(dispatcher), url_(url) {}

  void setCallbacks(transport::TransportCallbacks& callbacks) override {
    callbacks_ = &callbacks;
  }

  void open() override {
    ++open_calls;
    if (open_on_request) {
      dispatcher_.post([this]() { emitOpen(); });
    }
  }

  bool send(const std::string& message) override {
    if (!open_) {
      return false;
    }
    sent.push_back(message);
    if (on_send) {
      on_send(message);
    }
    return true;
  }

  void close() override {
    open_ = false;
    closed_by_owner = true;
  }

  bool isOpen() const override { return open_; }

  // Event injection
  void emitOpen() {
    open_ = true;
    callbacks_->onOpen();
  }
  void emitData(const std::string& message) { callbacks_->onData(message); }
  void emitError(const std::string& error) { callbacks_->onError(error); }
  void emitClose(int code, const std::string& reason) {
    open_ = false;
    callbacks_->onClose(code, reason);
  }

  // Deliver a server message on the next dispatcher turn
  void reply(const std::string& message) {
    dispatcher_.post([this, message]() {
      if (open_) {
        emitData(message);
      }
    });
  }

  const std::string& url() const { return url_; }

  bool open_on_request{true};
  int open_calls{0};
  bool closed_by_owner{false};
  std::vector<std::string> sent;
  std::function<void(const std::string&)> on_send;

 private:
  event::Dispatcher& dispatcher_;
  std::string url_;
  transport::TransportCallbacks* callbacks_{nullptr};
  bool open_{false};
};

/**
 * Factory handing out FakeTransports. Every transport ever created stays
 * reachable through created; configure runs on each before it is returned.
 */
class FakeTransportFactory {
 public:
  explicit FakeTransportFactory(event::Dispatcher& dispatcher)
      : dispatcher_(dispatcher) {}

  transport::TransportFactory factory() {
    return [this](const std::string& url) -> transport::TransportPtr {
      auto transport = std::make_unique<FakeTransport>(dispatcher_, url);
      created.push_back(transport.get());
      if (configure) {
        configure(*transport);
      }
      return transport;
    };
  }

  FakeTransport* last() { return created.empty() ? nullptr : created.back(); }

  std::vector<FakeTransport*> created;
  std::function<void(FakeTransport&)> configure;

 private:
  event::Dispatcher& dispatcher_;
};

}  // namespace test
}  // namespace realmlink
