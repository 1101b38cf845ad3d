#include "ipcwire/net/loopback_transport.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace ipcwire::net
{

    void LoopbackTransport::deliver(const std::string &route, const std::string &payload)
    {
        spdlog::trace("Loopback delivery #{} on {} ({} bytes)", deliveries_.size(), route, payload.size());
        deliveries_.push_back(Delivery{route, payload});
    }

    std::vector<Delivery> LoopbackTransport::take()
    {
        return std::exchange(deliveries_, {});
    }

} // namespace ipcwire::net
