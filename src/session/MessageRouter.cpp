// SPDX-License-Identifier: Apache-2.0
#include "MessageRouter.hpp"

#include <core/Log.hpp>

#include <exception>

namespace meetlink
{

auto MessageRouter::subscribe(std::string_view type, Handler handler) -> Subscription
{
    auto lock = std::lock_guard(_mutex);
    auto const id = _nextId++;

    auto it = _handlers.find(type);
    if (it == _handlers.end())
        it = _handlers.emplace(std::string(type), std::vector<Entry> {}).first;
    it->second.emplace_back(id, std::make_shared<Handler>(std::move(handler)));

    return Subscription { .type = std::string(type), .id = id };
}

auto MessageRouter::unsubscribe(const Subscription& subscription) -> bool
{
    auto lock = std::lock_guard(_mutex);

    auto const it = _handlers.find(subscription.type);
    if (it == _handlers.end())
        return false;

    auto const removed =
        std::erase_if(it->second, [&](auto const& entry) { return entry.first == subscription.id; }) > 0;
    if (it->second.empty())
        _handlers.erase(it);
    return removed;
}

auto MessageRouter::dispatch(const TypedMessage& message) const -> std::size_t
{
    auto snapshot = std::vector<Entry> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (auto const it = _handlers.find(message.type); it != _handlers.end())
            snapshot = it->second;
        if (message.type != Wildcard)
        {
            if (auto const it = _handlers.find(Wildcard); it != _handlers.end())
                snapshot.insert(snapshot.end(), it->second.begin(), it->second.end());
        }
    }

    if (snapshot.empty())
    {
        log::trace("No handler for message type '{}'", message.type);
        return 0;
    }

    for (auto const& [id, handler]: snapshot)
    {
        try
        {
            (*handler)(message);
        }
        catch (const std::exception& e)
        {
            log::error("Handler #{} for '{}' threw: {}", id, message.type, e.what());
        }
        catch (...)
        {
            log::error("Handler #{} for '{}' threw a non-standard exception", id, message.type);
        }
    }

    return snapshot.size();
}

auto MessageRouter::handlerCount(std::string_view type) const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _handlers.find(type);
    return it == _handlers.end() ? 0 : it->second.size();
}

} // namespace meetlink
