#include "ipcwire/net/reassembler.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "ipcwire/error_codes.hpp"

namespace ipcwire::net
{

    Reassembler::Reassembler(ReassemblyPolicy policy)
        : policy_(policy)
    {
    }

    std::optional<std::vector<std::string>> Reassembler::accept(const FragmentHeader &header, std::string fragment,
                                                                Clock::time_point now)
    {
        if (policy_.timeout.count() > 0)
        {
            evict_expired(now);
        }

        auto it = entries_.find(header.guid);
        if (it == entries_.end())
        {
            if (policy_.max_pending > 0 && entries_.size() >= policy_.max_pending)
            {
                evict_oldest();
            }
            Entry entry;
            entry.first_seen = now;
            it = entries_.emplace(header.guid, std::move(entry)).first;
        }
        auto &entry = it->second;

        if (header.is_final)
        {
            entry.expected_count = static_cast<std::int64_t>(header.index) + 1;
        }

        if (auto existing = entry.fragments.find(header.index); existing != entry.fragments.end())
        {
            if (existing->second != fragment)
            {
                spdlog::warn("Message {} received different content for fragment {}; possible guid collision",
                             header.guid, header.index);
            }
            existing->second = std::move(fragment);
        }
        else
        {
            entry.fragments.emplace(header.index, std::move(fragment));
        }

        if (entry.expected_count < 0 || static_cast<std::int64_t>(entry.fragments.size()) != entry.expected_count)
        {
            return std::nullopt;
        }

        std::vector<std::string> ordered;
        ordered.reserve(entry.fragments.size());
        for (std::int64_t index = 0; index < entry.expected_count; ++index)
        {
            auto found = entry.fragments.find(static_cast<std::uint32_t>(index));
            if (found == entry.fragments.end())
            {
                const auto guid = header.guid;
                entries_.erase(it);
                throw Error(ErrorCode::MissingFragment,
                            "message " + guid + " is missing fragment " + std::to_string(index));
            }
            ordered.push_back(std::move(found->second));
        }
        entries_.erase(it);
        spdlog::debug("Message {} reassembled from {} fragment(s)", header.guid, ordered.size());
        return ordered;
    }

    std::size_t Reassembler::evict_expired(Clock::time_point now)
    {
        if (policy_.timeout.count() <= 0)
        {
            return 0;
        }
        std::size_t evicted = 0;
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (now - it->second.first_seen > policy_.timeout)
            {
                spdlog::warn("Evicting incomplete message {} after {} ms ({} fragment(s) buffered)", it->first,
                             policy_.timeout.count(), it->second.fragments.size());
                it = entries_.erase(it);
                ++evicted;
            }
            else
            {
                ++it;
            }
        }
        return evicted;
    }

    void Reassembler::evict_oldest()
    {
        auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                       [](const auto &lhs, const auto &rhs)
                                       { return lhs.second.first_seen < rhs.second.first_seen; });
        if (oldest == entries_.end())
        {
            return;
        }
        spdlog::warn("Evicting incomplete message {} to stay within {} pending message(s)", oldest->first,
                     policy_.max_pending);
        entries_.erase(oldest);
    }

} // namespace ipcwire::net
