// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Signal.hpp>
#include <core/Types.hpp>

#include <session/Connection.hpp>
#include <session/MessageRouter.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

namespace meetlink
{

enum class TransportState : std::uint8_t
{
    Disconnected,
    Connecting,
    Open,
    Closing,
};

[[nodiscard]] constexpr auto transportStateToString(TransportState state) -> std::string_view
{
    switch (state)
    {
        case TransportState::Disconnected: return "disconnected";
        case TransportState::Connecting: return "connecting";
        case TransportState::Open: return "open";
        case TransportState::Closing: return "closing";
    }
    return "unknown";
}

struct SessionTransportConfig
{
    /// @brief Delay between a connection loss (or failed attempt) and the next attempt.
    std::chrono::milliseconds reconnectDelay { 5000 };
};

/// @brief Long-lived bidirectional message channel to the back-end with automatic reconnect.
///
/// A single connection worker connects, reads inbound frames, dispatches them through
/// the MessageRouter, and waits out the reconnect delay after a failure. Every connection
/// attempt is a new SessionEpoch. Events are emitted on the connection worker, except
/// for errorOccurred which is also emitted by send() on the caller's thread.
class SessionTransport
{
  public:
    SessionTransport(SessionTransportConfig config, ConnectionFactory factory, MessageRouter& router);
    ~SessionTransport();

    SessionTransport(const SessionTransport&) = delete;
    SessionTransport& operator=(const SessionTransport&) = delete;

    /// @brief Starts connecting. No-op while connecting or open.
    void open();

    /// @brief Cancels any pending reconnect, closes the connection and joins the worker.
    ///
    /// The transport stays Disconnected until open() is called again.
    void close();

    /// @brief Sends @p message if the transport is open.
    ///
    /// Never waits for a connection: when not open the message is dropped, errorOccurred
    /// is emitted and a TransportError is returned.
    [[nodiscard]] auto send(const TypedMessage& message) -> VoidResult;

    [[nodiscard]] auto state() const -> TransportState;
    [[nodiscard]] auto currentEpoch() const -> SessionEpoch;

    /// @brief Number of connection attempts made since construction.
    [[nodiscard]] auto connectAttempts() const -> uint64_t;

    Signal<TransportState, SessionEpoch> stateChanged;
    Signal<Error> errorOccurred;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace meetlink
