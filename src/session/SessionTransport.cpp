// SPDX-License-Identifier: Apache-2.0
#include "SessionTransport.hpp"

#include <core/Log.hpp>

#include <session/Messages.hpp>

#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>

namespace meetlink
{

namespace
{

    auto wallClockMs() -> int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

} // namespace

struct SessionTransport::Impl
{
    SessionTransport* owner = nullptr;
    SessionTransportConfig config;
    ConnectionFactory factory;
    MessageRouter& router;

    std::mutex lifecycleMutex;
    std::mutex writeMutex;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    TransportState state = TransportState::Disconnected;
    SessionEpoch epoch { .epochId = 0, .connectedAtMs = 0, .state = EpochState::Closed };
    uint64_t attempts = 0;
    std::shared_ptr<Connection> connection;

    std::jthread worker;

    Impl(SessionTransportConfig config, ConnectionFactory factory, MessageRouter& router):
        config(config), factory(std::move(factory)), router(router)
    {
    }

    /// Applies a state change and returns the epoch snapshot to publish. Requires mutex.
    auto transition(TransportState next, EpochState epochState) -> SessionEpoch
    {
        state = next;
        epoch.state = epochState;
        return epoch;
    }

    void publish(TransportState next, const SessionEpoch& snapshot)
    {
        log::debug("Transport {} (epoch {})", transportStateToString(next), snapshot.epochId);
        owner->stateChanged.emit(next, snapshot);
    }

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto conn = std::shared_ptr<Connection>(factory());
            auto snapshot = SessionEpoch {};
            {
                auto lock = std::lock_guard(mutex);
                if (stopToken.stop_requested())
                    break;
                connection = conn;
                ++attempts;
                epoch = SessionEpoch { .epochId = attempts, .connectedAtMs = 0, .state = EpochState::Connecting };
                snapshot = transition(TransportState::Connecting, EpochState::Connecting);
            }
            publish(TransportState::Connecting, snapshot);

            if (auto connected = conn->connect(); !connected)
            {
                if (!stopToken.stop_requested())
                {
                    log::warning("Connection attempt {} failed: {}", snapshot.epochId, connected.error());
                    owner->errorOccurred.emit(connected.error());
                }
            }
            else
            {
                auto opened = false;
                {
                    auto lock = std::lock_guard(mutex);
                    if (!stopToken.stop_requested())
                    {
                        epoch.connectedAtMs = wallClockMs();
                        snapshot = transition(TransportState::Open, EpochState::Open);
                        opened = true;
                    }
                }
                if (opened)
                {
                    log::info("Session connected (epoch {})", snapshot.epochId);
                    publish(TransportState::Open, snapshot);
                    readLoop(*conn, stopToken);
                }
            }

            conn->close();
            {
                auto lock = std::lock_guard(mutex);
                connection.reset();
                snapshot = transition(TransportState::Disconnected, EpochState::Closed);
            }
            publish(TransportState::Disconnected, snapshot);

            if (stopToken.stop_requested())
                break;

            log::info("Reconnecting in {} ms", config.reconnectDelay.count());
            auto lock = std::unique_lock(mutex);
            cv.wait_for(lock, stopToken, config.reconnectDelay, [] { return false; });
        }
    }

    void readLoop(Connection& conn, const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto frame = conn.receive();
            if (!frame)
            {
                if (!stopToken.stop_requested())
                {
                    log::warning("Session connection lost: {}", frame.error());
                    owner->errorOccurred.emit(frame.error());
                }
                return;
            }

            auto message = messages::parseMessage(*frame);
            if (!message)
            {
                log::warning("Discarding inbound frame: {}", message.error());
                continue;
            }

            log::trace("Inbound message '{}'", message->type);
            router.dispatch(*message);
        }
    }

    /// Stops and joins the worker. Must not be called from the worker itself.
    void stopWorker()
    {
        if (!worker.joinable())
            return;

        worker.request_stop();
        cv.notify_all();

        auto conn = std::shared_ptr<Connection> {};
        {
            auto lock = std::lock_guard(mutex);
            conn = connection;
        }
        if (conn)
            conn->close();

        worker.join();
        worker = std::jthread {};
    }
};

SessionTransport::SessionTransport(SessionTransportConfig config, ConnectionFactory factory, MessageRouter& router):
    _impl(std::make_unique<Impl>(config, std::move(factory), router))
{
    _impl->owner = this;
}

SessionTransport::~SessionTransport()
{
    close();
}

void SessionTransport::open()
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->worker.joinable())
    {
        if (!_impl->worker.get_stop_token().stop_requested())
            return;
        // A previous close() was issued from within a message handler.
        _impl->stopWorker();
    }

    log::debug("Opening session transport");
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

void SessionTransport::close()
{
    if (_impl->worker.joinable() && _impl->worker.get_id() == std::this_thread::get_id())
    {
        // Called from a handler on the connection worker: it cannot join itself.
        _impl->worker.request_stop();
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->connection)
            _impl->connection->close();
        return;
    }

    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);
    if (!_impl->worker.joinable())
        return;

    auto closing = false;
    auto snapshot = SessionEpoch {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->state == TransportState::Open)
        {
            snapshot = _impl->transition(TransportState::Closing, EpochState::Closing);
            closing = true;
        }
    }
    if (closing)
        _impl->publish(TransportState::Closing, snapshot);

    _impl->stopWorker();

    auto lock = std::lock_guard(_impl->mutex);
    _impl->transition(TransportState::Disconnected, EpochState::Closed);
    log::debug("Session transport closed");
}

auto SessionTransport::send(const TypedMessage& message) -> VoidResult
{
    auto conn = std::shared_ptr<Connection> {};
    auto currentState = TransportState::Disconnected;
    {
        auto lock = std::lock_guard(_impl->mutex);
        currentState = _impl->state;
        if (currentState == TransportState::Open)
            conn = _impl->connection;
    }

    if (!conn)
    {
        auto error = Error {
            .code = ErrorCode::TransportError,
            .message = std::format("Cannot send '{}': transport is {}",
                                   message.type,
                                   transportStateToString(currentState)),
        };
        log::debug("{}", error.message);
        errorOccurred.emit(error);
        return std::unexpected(std::move(error));
    }

    auto const text = messages::serialize(message);
    auto result = VoidResult {};
    {
        auto lock = std::lock_guard(_impl->writeMutex);
        result = conn->send(text);
    }

    if (!result)
    {
        log::warning("Send of '{}' failed: {}", message.type, result.error());
        errorOccurred.emit(result.error());
    }
    return result;
}

auto SessionTransport::state() const -> TransportState
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->state;
}

auto SessionTransport::currentEpoch() const -> SessionEpoch
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->epoch;
}

auto SessionTransport::connectAttempts() const -> uint64_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->attempts;
}

} // namespace meetlink
