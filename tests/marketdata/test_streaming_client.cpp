/*
Slipstream — StreamingClient Tests
Role: Verify connect/subscribe/listen semantics, reconnect-with-resubscribe and error routing
Testing Strategy: Scripted FakeTransport per endpoint + MockAuthenticator → drive the io_context → assert frames written, callbacks and state
Coverage: Caller/auth rejection without I/O, initial connect retry, registry-after-write, bounded buffering before
          listen, protocol errors, replay after reconnect, endpoint isolation, stale transports, retry exhaustion,
          stop and loop drain, watchCandles
*/
#include <gtest/gtest.h>
#include "marketdata/StreamingClient.hpp"
#include "fixtures/coinbase_messages.hpp"
#include "fixtures/fake_transport.hpp"
#include "fixtures/mock_authenticator.hpp"
#include <set>

using namespace std::chrono_literals;
using Ids = std::vector<std::string>;

namespace {

ClientConfig testConfig(bool enablePublic = true, bool enableUser = false) {
    ClientConfig cfg;
    cfg.enablePublic = enablePublic;
    cfg.enableUser = enableUser;
    cfg.reconnect.initialDelay = 1ms;
    cfg.reconnect.maxDelay = 4ms;
    cfg.reconnect.maxRetries = 3;
    return cfg;
}

uint64_t heartbeatCounter(const MessageResult& r) {
    const auto& msg = std::get<Message>(r);
    return std::get<HeartbeatsEvent>(msg.events.at(0)).heartbeat_counter;
}

} // namespace

class StreamingClientTest : public ::testing::Test {
protected:
    net::io_context ioc;
    FakeTransportHub hub{ioc};
    std::shared_ptr<MockAuthenticator> auth = std::make_shared<MockAuthenticator>();
    std::unique_ptr<StreamingClient> client;

    std::vector<MessageResult> received;
    std::vector<std::pair<EndpointKind, StreamError>> fatals;

    void make(ClientConfig cfg, bool withAuth = true) {
        client = std::make_unique<StreamingClient>(ioc, std::move(cfg), hub.factory(),
                                                   withAuth ? auth : nullptr);
    }

    void connectOk() {
        bool done = false;
        std::optional<StreamError> err;
        client->connect([&](std::optional<StreamError> e) { err = std::move(e); done = true; });
        ASSERT_TRUE(runUntil(ioc, [&] { return done; }));
        ASSERT_FALSE(err.has_value()) << err->what();
    }

    void listenAll() {
        client->listen([this](const MessageResult& r) { received.push_back(r); },
                       [this](EndpointKind k, const StreamError& e) { fatals.emplace_back(k, e); });
        drain(ioc);
    }

    std::optional<StreamError> request(bool subscribe, Channel channel, Ids ids) {
        bool done = false;
        std::optional<StreamError> err;
        auto cb = [&](std::optional<StreamError> e) { err = std::move(e); done = true; };
        if (subscribe) client->subscribe(channel, std::move(ids), cb);
        else           client->unsubscribe(channel, std::move(ids), cb);
        EXPECT_TRUE(runUntil(ioc, [&] { return done; }));
        return err;
    }

    std::optional<StreamError> subscribe(Channel channel, Ids ids = {}) { return request(true, channel, std::move(ids)); }
    std::optional<StreamError> unsubscribe(Channel channel, Ids ids = {}) { return request(false, channel, std::move(ids)); }

    void settle(std::chrono::milliseconds d = 30ms) {
        const auto until = std::chrono::steady_clock::now() + d;
        runUntil(ioc, [&] { return std::chrono::steady_clock::now() >= until; }, d + 1s);
    }
};

// =============================================================================
// Construction & Caller Errors
// =============================================================================

TEST_F(StreamingClientTest, ConstructionRequiresAnEnabledEndpoint) {
    try {
        make(testConfig(false, false));
        FAIL() << "expected StreamError";
    } catch (const StreamError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Caller);
    }
}

TEST_F(StreamingClientTest, DisabledEndpointThrowsWithoutIoOrToken) {
    auto cfg = testConfig(true, false);
    cfg.rateLimit = {2, 0.001};
    make(cfg);
    connectOk();

    try {
        client->subscribe(Channel::User, {"BTC-USD"});
        FAIL() << "expected StreamError";
    } catch (const StreamError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Caller);
    }
    drain(ioc);

    EXPECT_EQ(hub.count(EndpointKind::User), 0u);
    EXPECT_TRUE(hub.latest(EndpointKind::Public)->sent().empty());
    EXPECT_EQ(auth->calls(), 0);
    EXPECT_NEAR(client->rateLimiter(EndpointKind::Public).available(), 2.0, 1e-6);
    EXPECT_TRUE(client->subscriptions().snapshot(EndpointKind::User).empty());
}

TEST_F(StreamingClientTest, UserChannelWithoutAuthenticatorThrows) {
    make(testConfig(true, true), /*withAuth=*/false);
    try {
        client->subscribe(Channel::FuturesBalanceSummary, {});
        FAIL() << "expected StreamError";
    } catch (const StreamError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Authentication);
    }
}

TEST_F(StreamingClientTest, SubscribeBeforeConnectIsCallerErrorAndSpendsNoToken) {
    auto cfg = testConfig();
    cfg.rateLimit = {2, 0.001};
    make(cfg);

    auto err = subscribe(Channel::Ticker, {"BTC-USD"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Caller);
    EXPECT_NEAR(client->rateLimiter(EndpointKind::Public).available(), 2.0, 1e-6);
    EXPECT_EQ(hub.count(EndpointKind::Public), 0u);
}

// =============================================================================
// Connect
// =============================================================================

TEST_F(StreamingClientTest, ConnectOpensEveryEnabledEndpoint) {
    make(testConfig(true, true));
    connectOk();

    ASSERT_EQ(hub.count(EndpointKind::Public), 1u);
    ASSERT_EQ(hub.count(EndpointKind::User), 1u);
    EXPECT_EQ(hub.latest(EndpointKind::Public)->address().host, "advanced-trade-ws.coinbase.com");
    EXPECT_EQ(hub.latest(EndpointKind::User)->address().host, "advanced-trade-ws-user.coinbase.com");
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
    EXPECT_EQ(client->state(EndpointKind::User), EndpointState::Connected);
}

TEST_F(StreamingClientTest, InitialConnectRetriesAfterRefusal) {
    make(testConfig());
    hub.failNextConnects(EndpointKind::Public, 1);

    connectOk();
    EXPECT_EQ(hub.count(EndpointKind::Public), 2u);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
}

TEST_F(StreamingClientTest, InitialConnectGivesUpAfterRetries) {
    auto cfg = testConfig();
    cfg.reconnect.maxRetries = 2;
    make(cfg);
    listenAll();
    hub.failNextConnects(EndpointKind::Public, 10);

    bool done = false;
    std::optional<StreamError> err;
    client->connect([&](std::optional<StreamError> e) { err = std::move(e); done = true; });
    ASSERT_TRUE(runUntil(ioc, [&] { return done; }));
    settle();

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Connection);
    EXPECT_EQ(hub.count(EndpointKind::Public), 3u); // first try + two retries
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Disconnected);
    EXPECT_TRUE(fatals.empty());
}

TEST_F(StreamingClientTest, InitialConnectWithReconnectDisabledFailsAtOnce) {
    auto cfg = testConfig();
    cfg.reconnect.autoReconnect = false;
    make(cfg);
    hub.failNextConnects(EndpointKind::Public, 1);

    bool done = false;
    std::optional<StreamError> err;
    client->connect([&](std::optional<StreamError> e) { err = std::move(e); done = true; });
    ASSERT_TRUE(runUntil(ioc, [&] { return done; }));
    settle();

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Connection);
    EXPECT_EQ(hub.count(EndpointKind::Public), 1u);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Disconnected);
}

TEST_F(StreamingClientTest, ConnectWhileReconnectingReplaysSubscriptions) {
    auto cfg = testConfig();
    cfg.reconnect.initialDelay = 200ms;
    cfg.reconnect.maxDelay = 200ms;
    make(cfg);
    connectOk();
    listenAll();
    ASSERT_FALSE(subscribe(Channel::Ticker, {"BTC-USD"}).has_value());

    hub.latest(EndpointKind::Public)->drop();
    drain(ioc);
    ASSERT_EQ(client->state(EndpointKind::Public), EndpointState::Reconnecting);

    connectOk();
    ASSERT_TRUE(runUntil(ioc, [&] { return hub.latest(EndpointKind::Public)->sent().size() == 1; }));
    settle(300ms);

    EXPECT_EQ(hub.count(EndpointKind::Public), 2u);
    auto replay = hub.latest(EndpointKind::Public)->sentJson();
    ASSERT_EQ(replay.size(), 1u);
    EXPECT_EQ(replay[0]["type"], "subscribe");
    EXPECT_EQ(replay[0]["channel"], "ticker");
    EXPECT_EQ(replay[0]["product_ids"], nlohmann::json::array({"BTC-USD"}));
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
    EXPECT_TRUE(fatals.empty());
}

// =============================================================================
// Subscribe / Unsubscribe
// =============================================================================

TEST_F(StreamingClientTest, PublicSubscribeWritesTimestampedFrameThenRecords) {
    make(testConfig());
    connectOk();

    ASSERT_FALSE(subscribe(Channel::Ticker, {"BTC-USD", "ETH-USD"}).has_value());

    auto sent = hub.sentOn(EndpointKind::Public);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["type"], "subscribe");
    EXPECT_EQ(sent[0]["channel"], "ticker");
    EXPECT_EQ(sent[0]["product_ids"], nlohmann::json::array({"BTC-USD", "ETH-USD"}));
    EXPECT_TRUE(sent[0]["timestamp"].is_string());
    EXPECT_FALSE(sent[0].contains("jwt"));

    EXPECT_EQ(client->subscriptions().snapshot(EndpointKind::Public).at(Channel::Ticker), (Ids{"BTC-USD", "ETH-USD"}));
}

TEST_F(StreamingClientTest, UserSubscribeSignsEveryFrame) {
    make(testConfig(true, true));
    connectOk();

    ASSERT_FALSE(subscribe(Channel::User, {"BTC-USD"}).has_value());
    auth->setJwt("second_token");
    ASSERT_FALSE(subscribe(Channel::FuturesBalanceSummary).has_value());

    EXPECT_EQ(auth->calls(), 2);
    auto sent = hub.sentOn(EndpointKind::User);
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0]["jwt"], "test_jwt_token");
    EXPECT_EQ(sent[1]["jwt"], "second_token");
    EXPECT_EQ(sent[1]["channel"], "futures_balance_summary");
    EXPECT_FALSE(sent[1].contains("product_ids"));
    EXPECT_TRUE(hub.sentOn(EndpointKind::Public).empty());
}

TEST_F(StreamingClientTest, SigningFailureIsAuthenticationError) {
    make(testConfig(true, true));
    connectOk();
    auth->setShouldThrow(true);

    auto err = subscribe(Channel::User, {"BTC-USD"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Authentication);
    EXPECT_TRUE(hub.sentOn(EndpointKind::User).empty());
    EXPECT_TRUE(client->subscriptions().snapshot(EndpointKind::User).empty());
}

TEST_F(StreamingClientTest, WriteFailureLeavesRegistryUntouched) {
    make(testConfig());
    connectOk();
    hub.latest(EndpointKind::Public)->setFailSends(true);

    auto err = subscribe(Channel::Candles, {"BTC-USD"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Connection);
    EXPECT_TRUE(client->subscriptions().snapshot(EndpointKind::Public).empty());
}

TEST_F(StreamingClientTest, SubscribeWhileReconnectingIsConnectionError) {
    auto cfg = testConfig();
    cfg.reconnect.initialDelay = 200ms;
    cfg.reconnect.maxDelay = 200ms;
    make(cfg);
    connectOk();
    listenAll();

    hub.latest(EndpointKind::Public)->drop();
    drain(ioc);
    ASSERT_EQ(client->state(EndpointKind::Public), EndpointState::Reconnecting);

    auto err = subscribe(Channel::Ticker, {"BTC-USD"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Connection);
    EXPECT_TRUE(client->subscriptions().snapshot(EndpointKind::Public).empty());

    ASSERT_TRUE(runUntil(ioc, [&] { return client->state(EndpointKind::Public) == EndpointState::Connected; }));
    EXPECT_FALSE(subscribe(Channel::Ticker, {"BTC-USD"}).has_value());
}

TEST_F(StreamingClientTest, UnsubscribeRemovesOnlyListedIds) {
    make(testConfig());
    connectOk();

    ASSERT_FALSE(subscribe(Channel::Level2, {"BTC-USD", "ETH-USD"}).has_value());
    ASSERT_FALSE(unsubscribe(Channel::Level2, {"BTC-USD"}).has_value());

    auto sent = hub.sentOn(EndpointKind::Public);
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1]["type"], "unsubscribe");
    EXPECT_EQ(client->subscriptions().snapshot(EndpointKind::Public).at(Channel::Level2), (Ids{"ETH-USD"}));
}

// =============================================================================
// Listen
// =============================================================================

TEST_F(StreamingClientTest, FramesBeforeListenAreBufferedInOrder) {
    make(testConfig());
    connectOk();

    auto t = hub.latest(EndpointKind::Public);
    t->pushText(fixtures::heartbeat(1));
    t->pushText(fixtures::heartbeat(2));
    drain(ioc);
    EXPECT_TRUE(received.empty());

    listenAll();
    t->pushText(fixtures::heartbeat(3));
    drain(ioc);

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(heartbeatCounter(received[0]), 1u);
    EXPECT_EQ(heartbeatCounter(received[1]), 2u);
    EXPECT_EQ(heartbeatCounter(received[2]), 3u);
}

TEST_F(StreamingClientTest, BufferBeforeListenIsBounded) {
    make(testConfig());
    connectOk();

    const std::size_t cap = EndpointConnection::kMaxBufferedFrames;
    auto t = hub.latest(EndpointKind::Public);
    for (std::size_t i = 1; i <= cap + 10; ++i) {
        t->pushText(fixtures::heartbeat(i));
    }
    drain(ioc);
    EXPECT_TRUE(received.empty());

    listenAll();
    ASSERT_EQ(received.size(), cap);
    EXPECT_EQ(heartbeatCounter(received.front()), 1u);
    EXPECT_EQ(heartbeatCounter(received.back()), cap);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
}

TEST_F(StreamingClientTest, MalformedFrameIsProtocolErrorAndConnectionStaysUp) {
    make(testConfig());
    connectOk();
    listenAll();

    auto t = hub.latest(EndpointKind::Public);
    t->pushRaw("{not json");
    t->pushText(fixtures::providerError("Failed to subscribe"));
    t->pushText(fixtures::heartbeat(9));
    drain(ioc);

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(std::get<StreamError>(received[0]).kind(), ErrorKind::Protocol);
    EXPECT_EQ(std::get<StreamError>(received[1]).kind(), ErrorKind::Protocol);
    EXPECT_EQ(heartbeatCounter(received[2]), 9u);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
    EXPECT_EQ(hub.count(EndpointKind::Public), 1u);
}

TEST_F(StreamingClientTest, WronglyTypedEnvelopeIsProtocolErrorAndLoopContinues) {
    make(testConfig());
    connectOk();
    listenAll();

    auto t = hub.latest(EndpointKind::Public);
    t->pushRaw(R"({"type":7})");
    t->pushRaw(R"({"type":"error","message":42})");
    t->pushText(fixtures::heartbeat(4));
    drain(ioc);

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(std::get<StreamError>(received[0]).kind(), ErrorKind::Protocol);
    EXPECT_EQ(std::get<StreamError>(received[1]).kind(), ErrorKind::Protocol);
    EXPECT_EQ(heartbeatCounter(received[2]), 4u);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
    EXPECT_EQ(hub.count(EndpointKind::Public), 1u);
}

TEST_F(StreamingClientTest, PingAndPongAreNotDelivered) {
    make(testConfig());
    connectOk();
    listenAll();

    auto t = hub.latest(EndpointKind::Public);
    t->push(Frame{FrameKind::Ping, ""});
    t->push(Frame{FrameKind::Pong, ""});
    drain(ioc);

    EXPECT_TRUE(received.empty());
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
}

TEST_F(StreamingClientTest, MergesFramesFromBothEndpoints) {
    make(testConfig(true, true));
    connectOk();
    listenAll();

    hub.latest(EndpointKind::Public)->pushText(fixtures::heartbeat(1));
    hub.latest(EndpointKind::User)->pushText(fixtures::userOrders("o-1", "OPEN"));
    drain(ioc);

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(std::get<Message>(received[0]).channel, Channel::Heartbeats);
    EXPECT_EQ(std::get<Message>(received[1]).channel, Channel::User);
}

TEST_F(StreamingClientTest, ListenOnDisabledEndpointThrows) {
    make(testConfig(true, false));
    EXPECT_THROW(client->listen({EndpointKind::User}, [](const MessageResult&) {}), StreamError);
}

// =============================================================================
// Reconnect
// =============================================================================

TEST_F(StreamingClientTest, ReconnectReplaysEachSubscriptionExactlyOnce) {
    make(testConfig());
    connectOk();
    listenAll();

    ASSERT_FALSE(subscribe(Channel::Heartbeats).has_value());
    ASSERT_FALSE(subscribe(Channel::Candles, {"BTC-USD"}).has_value());
    auto first = hub.latest(EndpointKind::Public);

    first->drop();
    ASSERT_TRUE(runUntil(ioc, [&] {
        return hub.count(EndpointKind::Public) == 2 && hub.latest(EndpointKind::Public)->sent().size() == 2;
    }));
    settle();

    auto second = hub.latest(EndpointKind::Public);
    ASSERT_NE(first, second);
    EXPECT_TRUE(first->isClosed());
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);

    auto replay = second->sentJson();
    ASSERT_EQ(replay.size(), 2u);
    std::set<std::string> channels;
    for (const auto& j : replay) {
        EXPECT_EQ(j["type"], "subscribe");
        channels.insert(j["channel"].get<std::string>());
        if (j["channel"] == "heartbeats") EXPECT_FALSE(j.contains("product_ids"));
        if (j["channel"] == "candles") EXPECT_EQ(j["product_ids"], nlohmann::json::array({"BTC-USD"}));
    }
    EXPECT_EQ(channels, (std::set<std::string>{"heartbeats", "candles"}));
    EXPECT_TRUE(fatals.empty());

    // The new transport feeds the same listen loop.
    second->pushText(fixtures::heartbeat(5));
    drain(ioc);
    ASSERT_FALSE(received.empty());
    EXPECT_EQ(heartbeatCounter(received.back()), 5u);
}

TEST_F(StreamingClientTest, ReconnectTouchesOnlyTheAffectedEndpoint) {
    auto cfg = testConfig(true, true);
    cfg.reconnect.initialDelay = 100ms;
    cfg.reconnect.maxDelay = 100ms;
    make(cfg);
    connectOk();
    listenAll();

    ASSERT_FALSE(subscribe(Channel::Ticker, {"BTC-USD"}).has_value());
    ASSERT_FALSE(subscribe(Channel::User, {"BTC-USD"}).has_value());

    hub.latest(EndpointKind::User)->drop();
    drain(ioc);
    ASSERT_EQ(client->state(EndpointKind::User), EndpointState::Reconnecting);

    // Public keeps delivering while User waits out its backoff.
    hub.latest(EndpointKind::Public)->pushText(fixtures::heartbeat(21));
    drain(ioc);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(heartbeatCounter(received[0]), 21u);
    EXPECT_EQ(client->state(EndpointKind::User), EndpointState::Reconnecting);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);

    ASSERT_TRUE(runUntil(ioc, [&] {
        return hub.count(EndpointKind::User) == 2 && hub.latest(EndpointKind::User)->sent().size() == 1;
    }));
    settle();

    EXPECT_EQ(hub.count(EndpointKind::Public), 1u);
    EXPECT_EQ(hub.latest(EndpointKind::Public)->sent().size(), 1u);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
    EXPECT_EQ(hub.latest(EndpointKind::User)->sentJson()[0]["channel"], "user");
}

TEST_F(StreamingClientTest, FramesFromReplacedTransportAreIgnored) {
    make(testConfig());
    connectOk();
    listenAll();

    auto first = hub.latest(EndpointKind::Public);
    first->drop();
    ASSERT_TRUE(runUntil(ioc, [&] { return client->state(EndpointKind::Public) == EndpointState::Connected &&
                                           hub.count(EndpointKind::Public) == 2; }));

    first->pushText(fixtures::heartbeat(77));
    drain(ioc);
    EXPECT_TRUE(received.empty());
}

TEST_F(StreamingClientTest, RetriesAfterFailedAttempts) {
    make(testConfig());
    connectOk();
    listenAll();

    hub.failNextConnects(EndpointKind::Public, 2);
    hub.latest(EndpointKind::Public)->drop();
    ASSERT_TRUE(runUntil(ioc, [&] { return client->state(EndpointKind::Public) == EndpointState::Connected &&
                                           hub.count(EndpointKind::Public) == 4; }));
    EXPECT_TRUE(fatals.empty());
}

TEST_F(StreamingClientTest, ExhaustedRetriesCloseEndpointAndReportFatalOnce) {
    auto cfg = testConfig();
    cfg.reconnect.maxRetries = 2;
    make(cfg);
    connectOk();
    listenAll();

    hub.failNextConnects(EndpointKind::Public, 10);
    hub.latest(EndpointKind::Public)->drop();
    ASSERT_TRUE(runUntil(ioc, [&] { return !fatals.empty(); }));
    settle();

    ASSERT_EQ(fatals.size(), 1u);
    EXPECT_EQ(fatals[0].first, EndpointKind::Public);
    EXPECT_EQ(fatals[0].second.kind(), ErrorKind::Connection);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Closed);
    EXPECT_EQ(hub.count(EndpointKind::Public), 3u); // initial + two attempts
}

TEST_F(StreamingClientTest, DisabledReconnectMakesDropFatal) {
    auto cfg = testConfig();
    cfg.reconnect.autoReconnect = false;
    make(cfg);
    connectOk();
    listenAll();

    hub.latest(EndpointKind::Public)->drop();
    drain(ioc);
    settle();

    ASSERT_EQ(fatals.size(), 1u);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Closed);
    EXPECT_EQ(hub.count(EndpointKind::Public), 1u);
}

TEST_F(StreamingClientTest, OtherEndpointKeepsServingAfterFatal) {
    auto cfg = testConfig(true, true);
    cfg.reconnect.maxRetries = 0;
    make(cfg);
    connectOk();
    listenAll();

    hub.latest(EndpointKind::User)->push(Frame{FrameKind::Close, "going away"});
    drain(ioc);
    ASSERT_EQ(fatals.size(), 1u);
    EXPECT_EQ(fatals[0].first, EndpointKind::User);

    hub.latest(EndpointKind::Public)->pushText(fixtures::heartbeat(11));
    drain(ioc);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(heartbeatCounter(received[0]), 11u);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Connected);
}

// =============================================================================
// Stop
// =============================================================================

TEST_F(StreamingClientTest, StopClosesEverythingWithoutFatal) {
    make(testConfig(true, true));
    connectOk();
    listenAll();

    client->stop();
    drain(ioc);

    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Closed);
    EXPECT_EQ(client->state(EndpointKind::User), EndpointState::Closed);
    EXPECT_TRUE(hub.latest(EndpointKind::Public)->isClosed());
    EXPECT_TRUE(hub.latest(EndpointKind::User)->isClosed());
    EXPECT_TRUE(fatals.empty());

    auto err = subscribe(Channel::Ticker, {"BTC-USD"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Caller);
}

TEST_F(StreamingClientTest, StopLetsTheLoopDrain) {
    make(testConfig(true, true));
    connectOk();
    listenAll();
    ASSERT_FALSE(subscribe(Channel::Heartbeats).has_value());

    client->stop();
    const auto start = std::chrono::steady_clock::now();
    ioc.restart();
    ioc.run_for(2s);

    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_TRUE(ioc.stopped());
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Closed);
    EXPECT_EQ(client->state(EndpointKind::User), EndpointState::Closed);
    EXPECT_TRUE(fatals.empty());
}

TEST_F(StreamingClientTest, StopDuringInitialRetriesEndsConnect) {
    auto cfg = testConfig();
    cfg.reconnect.initialDelay = 200ms;
    cfg.reconnect.maxDelay = 200ms;
    make(cfg);
    hub.failNextConnects(EndpointKind::Public, 10);

    bool done = false;
    std::optional<StreamError> err;
    client->connect([&](std::optional<StreamError> e) { err = std::move(e); done = true; });
    drain(ioc);
    ASSERT_FALSE(done);
    ASSERT_EQ(client->state(EndpointKind::Public), EndpointState::Connecting);

    client->stop();
    ASSERT_TRUE(runUntil(ioc, [&] { return done; }));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Connection);
    EXPECT_EQ(client->state(EndpointKind::Public), EndpointState::Closed);
    EXPECT_EQ(hub.count(EndpointKind::Public), 1u);
}

// =============================================================================
// watchCandles
// =============================================================================

TEST_F(StreamingClientTest, WatchCandlesSubscribesThenEmitsCompletedCandles) {
    make(testConfig());
    connectOk();

    struct Emitted { uint64_t now; std::string product; Candle candle; };
    std::vector<Emitted> emitted;
    bool done = false;
    std::optional<StreamError> err;

    client->watchCandles({"BTC-USD"},
        [&](uint64_t now, const std::string& product, const Candle& c) { emitted.push_back({now, product, c}); },
        [&](std::optional<StreamError> e) { err = std::move(e); done = true; },
        {},
        [] { return uint64_t{1700000123}; });
    ASSERT_TRUE(runUntil(ioc, [&] { return done; }));
    ASSERT_FALSE(err.has_value());

    auto sent = hub.sentOn(EndpointKind::Public);
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0]["channel"], "heartbeats");
    EXPECT_EQ(sent[1]["channel"], "candles");
    EXPECT_EQ(sent[1]["product_ids"], nlohmann::json::array({"BTC-USD"}));

    auto t = hub.latest(EndpointKind::Public);
    t->pushText(fixtures::heartbeat(1));
    t->pushText(fixtures::candles({{"BTC-USD", 1700000100, 100.0}}));
    t->pushText(fixtures::candles({{"BTC-USD", 1700000400, 101.0}}));
    drain(ioc);

    ASSERT_EQ(emitted.size(), 1u);
    EXPECT_EQ(emitted[0].product, "BTC-USD");
    EXPECT_EQ(emitted[0].candle.start, 1700000100u);
    EXPECT_EQ(emitted[0].now, 1700000123u - 1700000123u % 600u);
}
