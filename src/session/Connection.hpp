// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace meetlink
{

/// @brief Abstract duplex text-frame channel underneath the SessionTransport.
///
/// One Connection object serves exactly one connection attempt (one epoch).
/// receive() and send() may be called concurrently from different threads;
/// close() may be called from any thread and unblocks a pending receive().
class Connection
{
  public:
    virtual ~Connection() = default;

    /// @brief Establishes the connection (blocking).
    /// @return Success or a TransportError.
    [[nodiscard]] virtual auto connect() -> VoidResult = 0;

    /// @brief Sends one text frame.
    /// @return Success or a TransportError.
    [[nodiscard]] virtual auto send(std::string_view text) -> VoidResult = 0;

    /// @brief Receives the next text frame (blocking).
    /// @return The frame, or a TransportError once the connection is closed or broken.
    [[nodiscard]] virtual auto receive() -> Result<std::string> = 0;

    /// @brief Closes the connection. Idempotent.
    virtual void close() = 0;

    /// @brief Returns true while the connection is established.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

/// @brief Creates a fresh, unconnected Connection for every connection attempt.
using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;

} // namespace meetlink
