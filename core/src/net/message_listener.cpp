#include "ipcwire/net/message_listener.hpp"

#include <algorithm>

namespace ipcwire::net
{

    MessageListener::MessageListener(EndpointManager &endpoints, ReassemblyPolicy policy)
        : endpoints_(endpoints),
          policy_(policy)
    {
    }

    void MessageListener::track(const std::shared_ptr<Reassembler> &reassembler)
    {
        reassemblers_.erase(std::remove_if(reassemblers_.begin(), reassemblers_.end(),
                                           [](const std::weak_ptr<Reassembler> &weak)
                                           { return weak.expired(); }),
                            reassemblers_.end());
        reassemblers_.push_back(reassembler);
    }

    std::size_t MessageListener::evict_expired(Reassembler::Clock::time_point now)
    {
        std::size_t evicted = 0;
        for (const auto &weak : reassemblers_)
        {
            if (auto reassembler = weak.lock())
            {
                evicted += reassembler->evict_expired(now);
            }
        }
        return evicted;
    }

    std::size_t MessageListener::pending_messages() const
    {
        std::size_t pending = 0;
        for (const auto &weak : reassemblers_)
        {
            if (auto reassembler = weak.lock())
            {
                pending += reassembler->pending();
            }
        }
        return pending;
    }

    void MessageListener::close()
    {
        endpoints_.clear();
        reassemblers_.clear();
    }

} // namespace ipcwire::net
