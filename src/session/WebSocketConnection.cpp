// SPDX-License-Identifier: Apache-2.0
#include "WebSocketConnection.hpp"

#include <core/Log.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <atomic>
#include <charconv>
#include <format>
#include <mutex>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace meetlink
{

namespace
{

    using PlainStream = websocket::stream<tcp::socket>;
    using SecureStream = websocket::stream<beast::ssl_stream<tcp::socket>>;

    auto transportError(std::string_view what, const boost::system::error_code& ec) -> Error
    {
        return Error { .code = ErrorCode::TransportError, .message = std::format("{}: {}", what, ec.message()) };
    }

} // namespace

auto parseWebSocketUrl(std::string_view url) -> Result<WebSocketUrl>
{
    auto result = WebSocketUrl {};

    if (url.starts_with("wss://"))
    {
        result.secure = true;
        url.remove_prefix(6);
    }
    else if (url.starts_with("ws://"))
    {
        url.remove_prefix(5);
    }
    else
    {
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported URL scheme: '{}'", url));
    }

    auto authority = url;
    if (auto const slash = url.find('/'); slash != std::string_view::npos)
    {
        authority = url.substr(0, slash);
        result.target = std::string(url.substr(slash));
    }

    if (auto const colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        auto const portText = authority.substr(colon + 1);
        auto port = 0u;
        auto const [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc {} || ptr != portText.data() + portText.size() || port == 0 || port > 65535)
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid port in URL: '{}'", portText));
        result.port = std::string(portText);
        authority = authority.substr(0, colon);
    }
    else
    {
        result.port = result.secure ? "443" : "80";
    }

    if (authority.empty())
        return makeError(ErrorCode::InvalidArgument, "URL has no host");

    result.host = std::string(authority);
    return result;
}

struct WebSocketConnection::Impl
{
    WebSocketConnectionConfig config;
    WebSocketUrl url;

    net::io_context ioc;
    std::unique_ptr<ssl::context> tlsContext;
    std::unique_ptr<PlainStream> plain;
    std::unique_ptr<SecureStream> secure;

    std::mutex writeMutex;
    std::atomic<bool> connected { false };
    std::atomic<bool> handshaking { false };
    std::atomic<bool> closed { false };

    auto socket() -> tcp::socket&
    {
        if (secure)
            return beast::get_lowest_layer(*secure);
        return beast::get_lowest_layer(*plain);
    }

    /// Runs one asynchronous operation on the private io_context, bounded by the connect timeout.
    /// close() from another thread stops the io_context and so aborts the operation. A failed
    /// operation ends this connection, so the io_context is never run again afterwards.
    template <typename Start>
    auto runBounded(Start&& start) -> boost::system::error_code
    {
        auto ec = boost::system::error_code { net::error::would_block };
        start([&ec](boost::system::error_code result, auto&&...) { ec = result; });

        if (!closed.load())
        {
            ioc.restart();
            ioc.run_for(config.connectTimeout);
        }

        if (ec == net::error::would_block)
        {
            auto ignored = boost::system::error_code {};
            socket().close(ignored);
            return closed.load() ? net::error::operation_aborted : net::error::timed_out;
        }
        return ec;
    }

    template <typename Stream>
    auto handshake(Stream& ws, const tcp::resolver::results_type& endpoints) -> VoidResult
    {
        auto& lowest = beast::get_lowest_layer(ws);

        if (auto ec = runBounded([&](auto handler) { net::async_connect(lowest, endpoints, handler); }); ec)
            return std::unexpected(transportError(std::format("Connect to {}:{} failed", url.host, url.port), ec));

        if constexpr (std::is_same_v<Stream, SecureStream>)
        {
            if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), url.host.c_str()))
                return makeError(ErrorCode::TransportError, std::format("Failed to set TLS SNI for {}", url.host));
            ws.next_layer().set_verify_callback(ssl::host_name_verification(url.host));

            if (auto ec = runBounded(
                    [&](auto handler) { ws.next_layer().async_handshake(ssl::stream_base::client, handler); });
                ec)
                return std::unexpected(transportError("TLS handshake failed", ec));
        }

        ws.set_option(websocket::stream_base::decorator([headers = config.headers](websocket::request_type& req) {
            req.set(http::field::user_agent, "meetlink");
            for (auto const& [name, value]: headers)
                req.set(name, value);
        }));

        auto const hostHeader = (url.port == "80" || url.port == "443") ? url.host : url.host + ':' + url.port;
        if (auto ec = runBounded([&](auto handler) { ws.async_handshake(hostHeader, url.target, handler); }); ec)
            return std::unexpected(transportError("WebSocket handshake failed", ec));

        ws.text(true);
        return {};
    }
};

WebSocketConnection::WebSocketConnection(WebSocketConnectionConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

WebSocketConnection::~WebSocketConnection()
{
    close();
}

auto WebSocketConnection::connect() -> VoidResult
{
    auto& impl = *_impl;

    auto url = parseWebSocketUrl(impl.config.url);
    if (!url)
        return std::unexpected(url.error());
    impl.url = std::move(*url);

    if (impl.url.secure)
    {
        impl.tlsContext = std::make_unique<ssl::context>(ssl::context::tlsv12_client);
        impl.tlsContext->set_default_verify_paths();
        impl.tlsContext->set_verify_mode(ssl::verify_peer);
        impl.secure = std::make_unique<SecureStream>(impl.ioc, *impl.tlsContext);
    }
    else
    {
        impl.plain = std::make_unique<PlainStream>(impl.ioc);
    }

    impl.handshaking = true;

    log::debug("Connecting to {}://{}:{}{}",
               impl.url.secure ? "wss" : "ws",
               impl.url.host,
               impl.url.port,
               impl.url.target);

    auto resolver = tcp::resolver(impl.ioc);
    auto endpoints = tcp::resolver::results_type {};
    auto resolveError = impl.runBounded([&](auto handler) {
        resolver.async_resolve(impl.url.host,
                               impl.url.port,
                               [&endpoints, handler](boost::system::error_code ec,
                                                     tcp::resolver::results_type results) mutable {
                                   endpoints = std::move(results);
                                   handler(ec);
                               });
    });
    if (resolveError)
    {
        impl.handshaking = false;
        return std::unexpected(transportError(std::format("Cannot resolve {}", impl.url.host), resolveError));
    }

    auto result = impl.secure ? impl.handshake(*impl.secure, endpoints) : impl.handshake(*impl.plain, endpoints);
    impl.handshaking = false;
    if (!result)
        return result;

    if (impl.closed.load())
        return makeError(ErrorCode::TransportError, "Connection closed during handshake");

    impl.connected = true;
    log::info("WebSocket connected to {}", impl.config.url);
    return {};
}

auto WebSocketConnection::send(std::string_view text) -> VoidResult
{
    auto& impl = *_impl;
    if (!impl.connected.load())
        return makeError(ErrorCode::TransportError, "WebSocket is not connected");

    auto lock = std::lock_guard(impl.writeMutex);
    auto ec = boost::system::error_code {};
    if (impl.secure)
        impl.secure->write(net::buffer(text.data(), text.size()), ec);
    else
        impl.plain->write(net::buffer(text.data(), text.size()), ec);

    if (ec)
    {
        impl.connected = false;
        return std::unexpected(transportError("WebSocket write failed", ec));
    }
    return {};
}

auto WebSocketConnection::receive() -> Result<std::string>
{
    auto& impl = *_impl;
    if (!impl.connected.load())
        return makeError(ErrorCode::TransportError, "WebSocket is not connected");

    auto buffer = beast::flat_buffer {};
    auto ec = boost::system::error_code {};
    if (impl.secure)
        impl.secure->read(buffer, ec);
    else
        impl.plain->read(buffer, ec);

    if (ec)
    {
        impl.connected = false;
        if (ec == websocket::error::closed)
            return makeError(ErrorCode::TransportError, "WebSocket closed by peer");
        return std::unexpected(transportError("WebSocket read failed", ec));
    }

    return beast::buffers_to_string(buffer.data());
}

void WebSocketConnection::close()
{
    auto& impl = *_impl;
    if (impl.closed.exchange(true))
        return;

    if (impl.handshaking.load())
    {
        impl.ioc.stop();
        return;
    }

    if (!impl.connected.exchange(false))
        return;

    // Shutting the socket down unblocks a receive() on the connection worker without
    // waiting for the peer's close frame.
    auto ec = boost::system::error_code {};
    impl.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected)
        log::debug("WebSocket shutdown: {}", ec.message());
}

auto WebSocketConnection::isConnected() const -> bool
{
    return _impl->connected.load();
}

auto makeWebSocketConnectionFactory(WebSocketConnectionConfig config) -> ConnectionFactory
{
    return [config = std::move(config)]() -> std::unique_ptr<Connection> {
        return std::make_unique<WebSocketConnection>(config);
    };
}

} // namespace meetlink
