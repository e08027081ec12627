// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meetlink
{

/// @brief Routes inbound typed messages to the handlers registered for their type.
///
/// Handlers registered for the same type run in registration order on the dispatching
/// thread (the transport's connection worker). Handlers subscribed to Wildcard run after
/// the type-specific ones for every message. Dispatch works on a snapshot of the
/// handler list, so subscribing or unsubscribing from within a handler is allowed.
class MessageRouter
{
  public:
    using Handler = std::function<void(const TypedMessage&)>;

    static constexpr std::string_view Wildcard = "*";

    /// @brief Handle to a registered handler.
    struct Subscription
    {
        std::string type;
        uint64_t id = 0;

        [[nodiscard]] auto valid() const noexcept -> bool { return id != 0; }
    };

    /// @brief Registers @p handler for messages of @p type (or Wildcard).
    auto subscribe(std::string_view type, Handler handler) -> Subscription;

    /// @brief Removes a registration. Unknown or already removed subscriptions are ignored.
    /// @return true if a handler was removed.
    auto unsubscribe(const Subscription& subscription) -> bool;

    /// @brief Invokes all handlers registered for @p message's type.
    /// @return Number of handlers invoked.
    auto dispatch(const TypedMessage& message) const -> std::size_t;

    [[nodiscard]] auto handlerCount(std::string_view type) const -> std::size_t;

  private:
    using Entry = std::pair<uint64_t, std::shared_ptr<Handler>>;

    mutable std::mutex _mutex;
    std::map<std::string, std::vector<Entry>, std::less<>> _handlers;
    uint64_t _nextId = 1;
};

} // namespace meetlink
