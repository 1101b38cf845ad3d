/**
 * ipcwire - Outbound side of the host channel.
 */
#pragma once

#include <string>

namespace ipcwire::net
{

    /// Submits one fragment for delivery. `route` is `encodedEndpoint:encodedHeader`.
    /// Delivery order and reliability are up to the implementation.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        virtual void deliver(const std::string &route, const std::string &payload) = 0;
    };

} // namespace ipcwire::net
