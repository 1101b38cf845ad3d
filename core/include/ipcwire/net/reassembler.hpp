/**
 * ipcwire - Per-guid fragment buffering until a message is complete.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ipcwire/net/header.hpp"

namespace ipcwire::net
{

    /// Zero disables the corresponding limit.
    struct ReassemblyPolicy
    {
        std::chrono::milliseconds timeout{0};
        std::size_t max_pending{0};
    };

    /// Fragments may arrive in any order. The message length becomes known once
    /// the fragment flagged final arrives; the message completes when that many
    /// distinct indices are buffered.
    class Reassembler
    {
    public:
        using Clock = std::chrono::steady_clock;

        explicit Reassembler(ReassemblyPolicy policy = {});

        /// Buffers one fragment. Returns the ordered fragments once the message
        /// completes, std::nullopt while it is still partial. Throws
        /// Error{MissingFragment} when the count matches but an index in range is
        /// absent; the entry is dropped in that case.
        std::optional<std::vector<std::string>> accept(const FragmentHeader &header, std::string fragment,
                                                       Clock::time_point now = Clock::now());

        /// Drops entries older than the policy timeout. Returns how many were dropped.
        std::size_t evict_expired(Clock::time_point now = Clock::now());

        std::size_t pending() const noexcept { return entries_.size(); }

        const ReassemblyPolicy &policy() const noexcept { return policy_; }

    private:
        struct Entry
        {
            std::int64_t expected_count{-1};
            std::map<std::uint32_t, std::string> fragments;
            Clock::time_point first_seen{};
        };

        void evict_oldest();

        ReassemblyPolicy policy_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace ipcwire::net
