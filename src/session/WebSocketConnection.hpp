// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <session/Connection.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meetlink
{

/// @brief Parsed `ws://` or `wss://` endpoint.
struct WebSocketUrl
{
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

/// @brief Parses a WebSocket URL such as `wss://example.org/ws` or `ws://localhost:8000/ws`.
/// @return The URL parts, or InvalidArgument for another scheme or a missing host.
[[nodiscard]] auto parseWebSocketUrl(std::string_view url) -> Result<WebSocketUrl>;

/// @brief Configuration for a WebSocket connection.
struct WebSocketConnectionConfig
{
    std::string url;

    /// @brief Extra HTTP headers for the upgrade request (e.g. tunnel bypass headers).
    std::vector<std::pair<std::string, std::string>> headers;

    std::chrono::milliseconds connectTimeout { 10000 };
};

/// @brief Connection over a WebSocket (plain or TLS) using Boost.Beast.
///
/// Reads and writes are synchronous; the SessionTransport runs receive() on its
/// connection worker and send() on the caller's thread, serialized by a write mutex.
class WebSocketConnection: public Connection
{
  public:
    explicit WebSocketConnection(WebSocketConnectionConfig config);
    ~WebSocketConnection() override;

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    [[nodiscard]] auto connect() -> VoidResult override;
    [[nodiscard]] auto send(std::string_view text) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<std::string> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Returns a ConnectionFactory producing WebSocketConnections for @p config.
[[nodiscard]] auto makeWebSocketConnectionFactory(WebSocketConnectionConfig config) -> ConnectionFactory;

} // namespace meetlink
