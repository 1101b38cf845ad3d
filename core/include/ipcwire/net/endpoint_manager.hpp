/**
 * ipcwire - Registry of listeners keyed by endpoint name.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ipcwire/job.hpp"
#include "ipcwire/net/header.hpp"

namespace ipcwire::net
{

    using EndpointListener = std::function<Job<void>(FragmentHeader header, std::string fragment)>;
    using ListenerPtr = std::shared_ptr<const EndpointListener>;

    /// Removes exactly one registration. Safe to call more than once and after the
    /// manager is gone.
    using Unsubscribe = std::function<void()>;

    /// Not thread-safe: register, unregister and dispatch from the scheduler thread.
    class EndpointManager
    {
    public:
        EndpointManager();

        Unsubscribe register_listener(const std::string &endpoint, EndpointListener listener);

        /// Snapshot in registration order; empty when the endpoint is unknown.
        std::vector<ListenerPtr> listeners(const std::string &endpoint) const;

        bool has_listeners(const std::string &endpoint) const;
        std::size_t endpoint_count() const;
        void clear();

    private:
        struct Registration
        {
            std::uint64_t id;
            ListenerPtr listener;
        };

        struct State
        {
            std::map<std::string, std::vector<Registration>> endpoints;
            std::uint64_t next_id{1};
        };

        static void unregister(State &state, const std::string &endpoint, std::uint64_t id);

        std::shared_ptr<State> state_;
    };

} // namespace ipcwire::net
