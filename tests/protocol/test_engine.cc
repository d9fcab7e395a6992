#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "realmlink/protocol/engine.h"

#include "../mocks/fake_dispatcher.h"
#include "../mocks/fake_transport.h"

namespace realmlink {
namespace protocol {
namespace {

using json = nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

using test::FakeTransport;

class ProtocolEngineTest : public ::testing::Test {
 protected:
  void SetUp() override { createEngine(false); }

  void createEngine(bool housekeeping, bool auto_reconnect = true) {
    engine_.reset();
    EngineOptions options;
    options.housekeeping = housekeeping;
    options.auto_reconnect = auto_reconnect;
    options.jitter = []() { return 7; };
    engine_ = std::make_unique<ProtocolEngine>(
        dispatcher_,
        ConnectionIdentity{ServerType::EP, "EmpireEx_3", "wss://ep.test"},
        transports_.factory(), std::move(options));
    engine_->setConnectRoutine([this]() { ++connects_; });
  }

  // Open a transport and complete its open handshake
  FakeTransport* open() {
    engine_->init();
    dispatcher_.runPending();
    return transports_.last();
  }

  size_t countSent(FakeTransport* t, const std::string& message) {
    size_t n = 0;
    for (const auto& s : t->sent) {
      if (s == message) {
        ++n;
      }
    }
    return n;
  }

  test::FakeDispatcher dispatcher_;
  test::FakeTransportFactory transports_{dispatcher_};
  std::unique_ptr<ProtocolEngine> engine_;
  int connects_{0};
};

TEST_F(ProtocolEngineTest, InitOpensTransportForUrl) {
  FakeTransport* t = open();
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->url(), "wss://ep.test");
  EXPECT_EQ(t->open_calls, 1);
  EXPECT_TRUE(engine_->opened().isSet());
  EXPECT_FALSE(engine_->closed().isSet());
}

TEST_F(ProtocolEngineTest, ReinitReplacesTransport) {
  FakeTransport* first = open();
  engine_->init();
  EXPECT_TRUE(first->closed_by_owner);
  dispatcher_.runPending();
  EXPECT_EQ(transports_.created.size(), 2u);
  EXPECT_TRUE(engine_->opened().isSet());
}

TEST_F(ProtocolEngineTest, FramesOutboundMessages) {
  FakeTransport* t = open();
  engine_->sendRaw("lli", {"a", "b"});
  engine_->sendJson("gbd", json::parse(R"({"x":1})"));
  engine_->sendXml("sys", "verChk", "0", "<ver v='166' />");
  ASSERT_EQ(t->sent.size(), 3u);
  EXPECT_EQ(t->sent[0], "%xt%EmpireEx_3%lli%1%a%b%");
  EXPECT_EQ(t->sent[1], R"(%xt%EmpireEx_3%gbd%1%{"x":1}%)");
  EXPECT_EQ(t->sent[2],
            "<msg t='sys'><body action='verChk' r='0'><ver v='166' />"
            "</body></msg>");
}

TEST_F(ProtocolEngineTest, SendWithoutOpenTransportIsDropped) {
  engine_->init();
  FakeTransport* t = transports_.last();
  engine_->sendRaw("nop", {});
  EXPECT_TRUE(t->sent.empty());
}

TEST_F(ProtocolEngineTest, DeliversMatchingFrameToWaiter) {
  FakeTransport* t = open();
  int calls = 0;
  engine_->waitForDelimited(
      "gbd", MatchSpec::pattern(json::parse(R"({"id":2})")),
      [&](Result<ParsedResponse> result) {
        ++calls;
        ASSERT_FALSE(isError(result));
        EXPECT_EQ(get<DelimitedFrame>(getValue(result)).payload["v"], "b");
      });
  EXPECT_EQ(engine_->pendingCount(), 1u);

  t->emitData(R"(%xt%gbd%1%0%{"id":1,"v":"a"}%)");
  EXPECT_EQ(calls, 0);
  t->emitData(R"(%xt%gbd%1%0%{"id":2,"v":"b"}%)");
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(engine_->pendingCount(), 0u);

  // A second identical frame has no waiter left
  t->emitData(R"(%xt%gbd%1%0%{"id":2,"v":"b"}%)");
  EXPECT_EQ(calls, 1);
}

TEST_F(ProtocolEngineTest, FirstRegisteredWaiterWins) {
  FakeTransport* t = open();
  std::vector<int> order;
  engine_->waitForDelimited("gpi", MatchSpec::any(),
                            [&](Result<ParsedResponse>) { order.push_back(1); });
  engine_->waitForDelimited("gpi", MatchSpec::any(),
                            [&](Result<ParsedResponse>) { order.push_back(2); });
  t->emitData("%xt%gpi%1%0%");
  EXPECT_EQ(order, std::vector<int>({1}));
  t->emitData("%xt%gpi%1%0%");
  EXPECT_EQ(order, std::vector<int>({1, 2}));
}

TEST_F(ProtocolEngineTest, XmlWaiter) {
  FakeTransport* t = open();
  bool ok = false;
  engine_->waitForXml("sys", "apiOK", "0", [&](Result<ParsedResponse> result) {
    ok = !isError(result);
  });
  t->emitData("<msg t='sys'><body action='apiOK' r='0'></body></msg>");
  EXPECT_TRUE(ok);
}

TEST_F(ProtocolEngineTest, UnansweredWaitTimesOutAndIsRemoved) {
  open();
  int code = 0;
  engine_->waitForDelimited("lli", MatchSpec::any(),
                            [&](Result<ParsedResponse> result) {
                              ASSERT_TRUE(isError(result));
                              code = getError(result).code;
                            });
  dispatcher_.advance(milliseconds(4999));
  EXPECT_EQ(code, 0);
  dispatcher_.advance(milliseconds(1));
  EXPECT_EQ(code, errors::kTimeout);
  EXPECT_EQ(engine_->pendingCount(), 0u);
}

TEST_F(ProtocolEngineTest, MalformedFrameIsDroppedAndLaterFramesStillMatch) {
  FakeTransport* t = open();
  bool ok = false;
  engine_->waitForDelimited("gpi", MatchSpec::any(),
                            [&](Result<ParsedResponse> result) {
                              ok = !isError(result);
                            });
  t->emitData("%xt%gpi%1%notanumber%");
  t->emitData("garbage");
  EXPECT_FALSE(ok);
  t->emitData("%xt%gpi%1%0%");
  EXPECT_TRUE(ok);
}

TEST_F(ProtocolEngineTest, BackoffTable) {
  EXPECT_EQ(ProtocolEngine::backoffDelay(0), seconds(120));
  EXPECT_EQ(ProtocolEngine::backoffDelay(1), seconds(180));
  EXPECT_EQ(ProtocolEngine::backoffDelay(2), seconds(300));
  EXPECT_EQ(ProtocolEngine::backoffDelay(3), seconds(600));
  EXPECT_EQ(ProtocolEngine::backoffDelay(4), seconds(1800));
  EXPECT_EQ(ProtocolEngine::backoffDelay(5), seconds(3600));
  EXPECT_EQ(ProtocolEngine::backoffDelay(40), seconds(3600));
}

TEST_F(ProtocolEngineTest, RestartRunsConnectRoutineAfterBackoffAndJitter) {
  open();
  engine_->restart();
  EXPECT_EQ(engine_->reconnectAttempts(), 1u);
  EXPECT_TRUE(engine_->reconnectRequested());
  EXPECT_FALSE(engine_->isConnected());

  dispatcher_.advance(seconds(127) - milliseconds(1));
  EXPECT_EQ(connects_, 0);
  dispatcher_.advance(milliseconds(1));
  EXPECT_EQ(connects_, 1);

  // Second attempt uses the next table entry
  engine_->restart();
  dispatcher_.advance(seconds(186));
  EXPECT_EQ(connects_, 1);
  dispatcher_.advance(seconds(1));
  EXPECT_EQ(connects_, 2);
}

TEST_F(ProtocolEngineTest, RepeatedRestartsCoalesce) {
  open();
  engine_->restart();
  engine_->restart();
  dispatcher_.advance(seconds(200));
  EXPECT_EQ(connects_, 1);
}

TEST_F(ProtocolEngineTest, RestartWithoutRoutineReinitializes) {
  engine_->setConnectRoutine(nullptr);
  open();
  engine_->restart();
  dispatcher_.advance(seconds(127));
  EXPECT_EQ(transports_.created.size(), 2u);
}

TEST_F(ProtocolEngineTest, PingAndCheckStartsHeartbeatAndHealthCheck) {
  open();
  engine_->restart();
  engine_->pingAndCheck();
  EXPECT_EQ(engine_->reconnectAttempts(), 0u);
  EXPECT_TRUE(engine_->isConnected());
}

TEST_F(ProtocolEngineTest, HeartbeatEveryMinute) {
  FakeTransport* t = open();
  t->on_send = [t](const std::string& m) {
    if (m.find("%gpi%") != std::string::npos) {
      t->reply("%xt%gpi%1%0%{}%");
    }
  };
  engine_->pingAndCheck();
  const std::string pin = "%xt%EmpireEx_3%pin%1%<RoundHouseKick>%";
  EXPECT_EQ(countSent(t, pin), 1u);
  EXPECT_EQ(countSent(t, "%xt%EmpireEx_3%gpi%1%{}%"), 1u);

  dispatcher_.advance(seconds(60));
  EXPECT_EQ(countSent(t, pin), 2u);
  dispatcher_.advance(seconds(60));
  EXPECT_EQ(countSent(t, pin), 3u);
}

TEST_F(ProtocolEngineTest, HousekeepingSendsGblOnceAfterLogin) {
  createEngine(true);
  FakeTransport* t = open();
  engine_->pingAndCheck();
  const std::string gbl = "%xt%EmpireEx_3%gbl%1%{}%";
  dispatcher_.advance(milliseconds(999));
  EXPECT_EQ(countSent(t, gbl), 0u);
  dispatcher_.advance(milliseconds(1));
  EXPECT_EQ(countSent(t, gbl), 1u);
  dispatcher_.advance(seconds(30));
  EXPECT_EQ(countSent(t, gbl), 1u);
}

TEST_F(ProtocolEngineTest, NoHousekeepingWhenDisabled) {
  FakeTransport* t = open();
  engine_->pingAndCheck();
  dispatcher_.advance(seconds(5));
  EXPECT_EQ(countSent(t, "%xt%EmpireEx_3%gbl%1%{}%"), 0u);
}

TEST_F(ProtocolEngineTest, AnsweredHealthCheckRepeatsEveryFifteenMinutes) {
  FakeTransport* t = open();
  t->on_send = [t](const std::string& m) {
    if (m.find("%gpi%") != std::string::npos) {
      t->reply("%xt%gpi%1%0%{}%");
    }
  };
  engine_->pingAndCheck();
  const std::string gpi = "%xt%EmpireEx_3%gpi%1%{}%";
  dispatcher_.runPending();
  EXPECT_EQ(countSent(t, gpi), 1u);
  dispatcher_.advance(minutes(15));
  EXPECT_EQ(countSent(t, gpi), 2u);
  EXPECT_EQ(connects_, 0);
}

TEST_F(ProtocolEngineTest, FailedHealthCheckRestartsAfterTenSeconds) {
  open();
  engine_->pingAndCheck();
  // No gpi answer: 5 s timeout, then 10 s retry delay, then backoff
  dispatcher_.advance(seconds(15));
  EXPECT_FALSE(engine_->isConnected());
  EXPECT_EQ(engine_->reconnectAttempts(), 1u);
  dispatcher_.advance(seconds(127));
  EXPECT_EQ(connects_, 1);
}

TEST_F(ProtocolEngineTest, FailedHealthCheckIgnoredOnceDisconnected) {
  open();
  engine_->pingAndCheck();
  // gpi times out after 5 s; the connection drops before the retry fires
  dispatcher_.advance(seconds(5));
  engine_->disconnect(false);
  dispatcher_.advance(seconds(10));
  EXPECT_EQ(engine_->reconnectAttempts(), 0u);
  dispatcher_.advance(minutes(30));
  EXPECT_EQ(connects_, 0);
}

TEST_F(ProtocolEngineTest, CheckWhileDisconnectedRestartsWhenStale) {
  open();
  engine_->checkConnection();
  EXPECT_EQ(engine_->pendingCount(), 0u);
  dispatcher_.advance(minutes(10));
  EXPECT_EQ(engine_->reconnectAttempts(), 1u);
  dispatcher_.advance(seconds(127));
  EXPECT_EQ(connects_, 1);
}

TEST_F(ProtocolEngineTest, StaleCheckDoesNotStackOnPendingRestart) {
  open();
  // Five coalesced restarts leave one pending for 1800 s plus jitter
  for (int i = 0; i < 5; ++i) {
    engine_->restart();
  }
  engine_->checkConnection();
  dispatcher_.advance(minutes(10));
  EXPECT_EQ(engine_->reconnectAttempts(), 5u);
  EXPECT_EQ(connects_, 0);
  dispatcher_.advance(seconds(1807) - minutes(10));
  EXPECT_EQ(connects_, 1);
}

TEST_F(ProtocolEngineTest, OnlyOneHealthCheckInFlight) {
  FakeTransport* t = open();
  engine_->pingAndCheck();
  engine_->checkConnection();
  engine_->checkConnection();
  EXPECT_EQ(countSent(t, "%xt%EmpireEx_3%gpi%1%{}%"), 1u);
  EXPECT_EQ(engine_->pendingCount(), 1u);
}

TEST_F(ProtocolEngineTest, PeerCloseDisconnectsAndRequestsReconnect) {
  FakeTransport* t = open();
  engine_->pingAndCheck();
  t->emitClose(transport::kCloseAbnormal, "");
  EXPECT_FALSE(engine_->isConnected());
  EXPECT_TRUE(engine_->reconnectRequested());
  EXPECT_FALSE(engine_->opened().isSet());
  EXPECT_TRUE(engine_->closed().isSet());
}

TEST_F(ProtocolEngineTest, DisconnectStopsHeartbeat) {
  FakeTransport* t = open();
  engine_->pingAndCheck();
  engine_->disconnect(false);
  EXPECT_FALSE(engine_->reconnectRequested());
  EXPECT_TRUE(t->closed_by_owner);
  dispatcher_.advance(seconds(120));
  EXPECT_EQ(countSent(t, "%xt%EmpireEx_3%pin%1%<RoundHouseKick>%"), 1u);
}

TEST_F(ProtocolEngineTest, TransportErrorRestartsWhenAutoReconnect) {
  FakeTransport* t = open();
  t->emitError("connection reset");
  EXPECT_EQ(engine_->reconnectAttempts(), 1u);
  dispatcher_.advance(seconds(127));
  EXPECT_EQ(connects_, 1);
}

TEST_F(ProtocolEngineTest, TransportErrorOnlyLogsWithoutAutoReconnect) {
  createEngine(false, false);
  FakeTransport* t = open();
  t->emitError("connection reset");
  EXPECT_EQ(engine_->reconnectAttempts(), 0u);
  dispatcher_.advance(minutes(90));
  EXPECT_EQ(connects_, 0);
}

TEST_F(ProtocolEngineTest, ErrorResponseRetriesAfterFiveMinutes) {
  open();
  engine_->handleErrorResponse("Login failed. Retrying connection in 5 minutes...");
  dispatcher_.advance(minutes(5) - milliseconds(1));
  EXPECT_EQ(engine_->reconnectAttempts(), 0u);
  dispatcher_.advance(milliseconds(1));
  EXPECT_EQ(engine_->reconnectAttempts(), 1u);
  dispatcher_.advance(seconds(127));
  EXPECT_EQ(connects_, 1);
}

TEST_F(ProtocolEngineTest, WaiterMayDestroyEngine) {
  FakeTransport* t = open();
  engine_->waitForDelimited("gpi", MatchSpec::any(),
                            [this](Result<ParsedResponse>) { engine_.reset(); });
  t->emitData("%xt%gpi%1%0%");
  EXPECT_EQ(engine_, nullptr);
  dispatcher_.runPending();
}

TEST_F(ProtocolEngineTest, DestroyingEngineFailsOutstandingWaits) {
  open();
  std::vector<int> codes;
  auto record = [&codes](Result<ParsedResponse> result) {
    ASSERT_TRUE(isError(result));
    codes.push_back(getError(result).code);
  };
  engine_->waitForDelimited("gdi", MatchSpec::any(), record);
  engine_->waitForXml("sys", "apiOK", "0", record);
  EXPECT_EQ(engine_->pendingCount(), 2u);

  engine_.reset();
  EXPECT_EQ(std::vector<int>({errors::kTimeout, errors::kTimeout}), codes);

  // Nothing fires later from the destroyed engine
  dispatcher_.advance(seconds(10));
  EXPECT_EQ(codes.size(), 2u);
}

}  // namespace
}  // namespace protocol
}  // namespace realmlink
