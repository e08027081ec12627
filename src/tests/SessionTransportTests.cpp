// SPDX-License-Identifier: Apache-2.0
#include <session/Messages.hpp>
#include <session/SessionTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "TestDoubles.hpp"

using namespace meetlink;
using namespace std::chrono_literals;
using meetlink::testing::eventually;
using meetlink::testing::FakeBackend;

namespace
{

    auto fastReconnect() -> SessionTransportConfig
    {
        return SessionTransportConfig { .reconnectDelay = 20ms };
    }

    /// Records published transport states.
    struct StateLog
    {
        std::mutex mutex;
        std::vector<TransportState> states;

        void attach(SessionTransport& transport)
        {
            transport.stateChanged.connect([this](TransportState state, const SessionEpoch&) {
                auto lock = std::lock_guard(mutex);
                states.push_back(state);
            });
        }

        auto snapshot() -> std::vector<TransportState>
        {
            auto lock = std::lock_guard(mutex);
            return states;
        }
    };

} // namespace

TEST_CASE("SessionTransport dispatches inbound messages and discards malformed frames", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    auto mutex = std::mutex {};
    auto transcripts = std::vector<std::string> {};
    auto subscription = router.subscribe(messages::TranscriptUpdateType, [&](const TypedMessage& message) {
        auto lock = std::lock_guard(mutex);
        transcripts.push_back(message.payload.value("transcript", ""));
    });

    transport.open();
    REQUIRE(eventually([&] { return transport.state() == TransportState::Open; }));
    CHECK(transport.currentEpoch().epochId == 1);
    CHECK(transport.currentEpoch().state == EpochState::Open);
    CHECK(transport.currentEpoch().connectedAtMs > 0);

    backend->push(R"({"type":"transcript_update","transcript":"hello","timestamp":1})");
    backend->push("this is not json");
    backend->push(R"({"no_type":true})");
    backend->push(R"({"type":"transcript_update","transcript":"again","timestamp":2})");

    REQUIRE(eventually([&] {
        auto lock = std::lock_guard(mutex);
        return transcripts.size() == 2;
    }));
    {
        auto lock = std::lock_guard(mutex);
        CHECK(transcripts == std::vector<std::string> { "hello", "again" });
    }

    // Malformed frames do not end the epoch.
    CHECK(transport.state() == TransportState::Open);
    CHECK(transport.connectAttempts() == 1);

    router.unsubscribe(subscription);
    transport.close();
}

TEST_CASE("SessionTransport reconnects with a new epoch after the connection drops", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    auto errors = std::atomic<int> { 0 };
    transport.errorOccurred.connect([&](const Error&) { ++errors; });

    transport.open();
    REQUIRE(eventually([&] { return transport.state() == TransportState::Open; }));
    CHECK(transport.currentEpoch().epochId == 1);

    backend->drop();

    REQUIRE(eventually([&] {
        return transport.connectAttempts() == 2 && transport.state() == TransportState::Open;
    }));
    CHECK(transport.currentEpoch().epochId == 2);
    CHECK(errors.load() >= 1);

    transport.close();
    CHECK(transport.state() == TransportState::Disconnected);
}

TEST_CASE("SessionTransport keeps retrying a refused connection", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    backend->setRefuse(true);

    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    transport.open();
    REQUIRE(eventually([&] { return transport.connectAttempts() >= 3; }));
    CHECK(transport.state() != TransportState::Open);

    backend->setRefuse(false);
    REQUIRE(eventually([&] { return transport.state() == TransportState::Open; }));

    transport.close();
}

TEST_CASE("SessionTransport close while connecting cancels the pending reconnect", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    backend->setHold(true);

    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    transport.open();
    REQUIRE(eventually([&] { return transport.state() == TransportState::Connecting; }));

    transport.close();
    CHECK(transport.state() == TransportState::Disconnected);
    CHECK(transport.connectAttempts() == 1);

    // Well past several reconnect delays.
    std::this_thread::sleep_for(150ms);
    CHECK(transport.connectAttempts() == 1);
    CHECK(backend->connectionsCreated() == 1);
    CHECK(transport.state() == TransportState::Disconnected);
}

TEST_CASE("SessionTransport close during the reconnect delay stops further attempts", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    backend->setRefuse(true);

    auto router = MessageRouter {};
    auto transport = SessionTransport { SessionTransportConfig { .reconnectDelay = 10s }, backend->factory(), router };

    transport.open();
    REQUIRE(eventually([&] {
        return transport.connectAttempts() == 1 && transport.state() == TransportState::Disconnected;
    }));

    auto const started = std::chrono::steady_clock::now();
    transport.close();
    CHECK(std::chrono::steady_clock::now() - started < 2s);
    CHECK(transport.connectAttempts() == 1);
}

TEST_CASE("SessionTransport send fails fast while disconnected", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    auto reported = std::vector<Error> {};
    transport.errorOccurred.connect([&](const Error& error) { reported.push_back(error); });

    auto const started = std::chrono::steady_clock::now();
    auto result = transport.send(messages::makeControl(messages::ControlAction::Mute));
    CHECK(std::chrono::steady_clock::now() - started < 500ms);

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    REQUIRE(reported.size() == 1);
    CHECK(reported[0].code == ErrorCode::TransportError);
    CHECK(backend->sent().empty());
    CHECK(backend->connectionsCreated() == 0);
}

TEST_CASE("SessionTransport send writes flat JSON frames while open", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    transport.open();
    REQUIRE(eventually([&] { return transport.state() == TransportState::Open; }));

    REQUIRE(transport.send(messages::makeControl(messages::ControlAction::Pause)).has_value());

    auto const controls = backend->sentOfType(messages::ControlType);
    REQUIRE(controls.size() == 1);
    CHECK(controls[0]["action"] == "pause");

    transport.close();
}

TEST_CASE("SessionTransport open is idempotent", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    transport.open();
    transport.open();
    REQUIRE(eventually([&] { return transport.state() == TransportState::Open; }));
    transport.open();

    std::this_thread::sleep_for(50ms);
    CHECK(transport.connectAttempts() == 1);
    CHECK(backend->connectionsCreated() == 1);

    transport.close();
}

TEST_CASE("SessionTransport publishes lifecycle states in order", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    auto log = StateLog {};
    log.attach(transport);

    transport.open();
    REQUIRE(eventually([&] { return transport.state() == TransportState::Open; }));
    transport.close();

    CHECK(log.snapshot()
          == std::vector<TransportState> {
              TransportState::Connecting,
              TransportState::Open,
              TransportState::Closing,
              TransportState::Disconnected,
          });
}

TEST_CASE("SessionTransport can be closed from a message handler and reopened", "[transport]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto router = MessageRouter {};
    auto transport = SessionTransport { fastReconnect(), backend->factory(), router };

    auto subscription =
        router.subscribe(messages::StatusType, [&](const TypedMessage&) { transport.close(); });

    transport.open();
    REQUIRE(eventually([&] { return transport.state() == TransportState::Open; }));

    backend->push(R"({"type":"status","status":"shutting_down"})");
    REQUIRE(eventually([&] { return transport.state() == TransportState::Disconnected; }));

    std::this_thread::sleep_for(50ms);
    CHECK(transport.connectAttempts() == 1);

    router.unsubscribe(subscription);
    transport.open();
    REQUIRE(eventually([&] { return transport.state() == TransportState::Open; }));
    CHECK(transport.currentEpoch().epochId == 2);

    transport.close();
}
