#include "ipcwire/net/endpoint_manager.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace ipcwire::net
{

    EndpointManager::EndpointManager()
        : state_(std::make_shared<State>())
    {
    }

    Unsubscribe EndpointManager::register_listener(const std::string &endpoint, EndpointListener listener)
    {
        const auto id = state_->next_id++;
        state_->endpoints[endpoint].push_back(
            Registration{id, std::make_shared<const EndpointListener>(std::move(listener))});
        spdlog::debug("Registered listener #{} on endpoint '{}'", id, endpoint);

        std::weak_ptr<State> weak = state_;
        return [weak, endpoint, id]()
        {
            if (auto state = weak.lock())
            {
                unregister(*state, endpoint, id);
            }
        };
    }

    void EndpointManager::unregister(State &state, const std::string &endpoint, std::uint64_t id)
    {
        auto it = state.endpoints.find(endpoint);
        if (it == state.endpoints.end())
        {
            return;
        }
        auto &list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Registration &registration)
                                  { return registration.id == id; }),
                   list.end());
        if (list.empty())
        {
            state.endpoints.erase(it);
            spdlog::debug("Endpoint '{}' has no listeners left", endpoint);
        }
    }

    std::vector<ListenerPtr> EndpointManager::listeners(const std::string &endpoint) const
    {
        std::vector<ListenerPtr> result;
        auto it = state_->endpoints.find(endpoint);
        if (it == state_->endpoints.end())
        {
            return result;
        }
        result.reserve(it->second.size());
        for (const auto &registration : it->second)
        {
            result.push_back(registration.listener);
        }
        return result;
    }

    bool EndpointManager::has_listeners(const std::string &endpoint) const
    {
        return state_->endpoints.contains(endpoint);
    }

    std::size_t EndpointManager::endpoint_count() const
    {
        return state_->endpoints.size();
    }

    void EndpointManager::clear()
    {
        state_->endpoints.clear();
    }

} // namespace ipcwire::net
