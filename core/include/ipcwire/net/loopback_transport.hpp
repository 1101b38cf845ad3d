/**
 * ipcwire - In-process transport that records deliveries for replay.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ipcwire/net/transport.hpp"

namespace ipcwire::net
{

    struct Delivery
    {
        std::string route;
        std::string payload;
    };

    class LoopbackTransport final : public Transport
    {
    public:
        void deliver(const std::string &route, const std::string &payload) override;

        const std::vector<Delivery> &deliveries() const noexcept { return deliveries_; }
        std::size_t size() const noexcept { return deliveries_.size(); }

        /// Hands over everything recorded so far and starts a fresh log.
        std::vector<Delivery> take();

        void clear() noexcept { deliveries_.clear(); }

    private:
        std::vector<Delivery> deliveries_;
    };

} // namespace ipcwire::net
