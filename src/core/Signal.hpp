// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace meetlink
{

/// @brief Token returned by Signal::connect(), used to remove the handler again.
using SubscriptionId = uint64_t;

/// @brief Thread-safe typed publish/subscribe channel.
///
/// Handlers run on the emitting thread in connection order. Emission iterates over a
/// snapshot, so handlers may connect or disconnect (including themselves) while being
/// invoked. An exception escaping one handler is logged and does not prevent the
/// remaining handlers from running.
template <typename... Args>
class Signal
{
  public:
    using Handler = std::function<void(Args...)>;

    /// @brief Registers a handler.
    /// @return The token to pass to disconnect().
    auto connect(Handler handler) -> SubscriptionId
    {
        auto lock = std::lock_guard(_mutex);
        auto const id = _nextId++;
        _handlers.emplace_back(id, std::make_shared<Handler>(std::move(handler)));
        return id;
    }

    /// @brief Removes a handler.
    /// @return true if the token was registered.
    auto disconnect(SubscriptionId id) -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return std::erase_if(_handlers, [id](auto const& entry) { return entry.first == id; }) > 0;
    }

    /// @brief Removes all handlers.
    void clear()
    {
        auto lock = std::lock_guard(_mutex);
        _handlers.clear();
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _handlers.size();
    }

    template <typename... CallArgs>
    void emit(CallArgs&&... args) const
    {
        auto snapshot = decltype(_handlers) {};
        {
            auto lock = std::lock_guard(_mutex);
            snapshot = _handlers;
        }

        for (auto const& [id, handler]: snapshot)
        {
            try
            {
                (*handler)(args...);
            }
            catch (const std::exception& e)
            {
                log::error("Signal handler #{} threw: {}", id, e.what());
            }
            catch (...)
            {
                log::error("Signal handler #{} threw a non-standard exception", id);
            }
        }
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::pair<SubscriptionId, std::shared_ptr<Handler>>> _handlers;
    SubscriptionId _nextId = 1;
};

} // namespace meetlink
