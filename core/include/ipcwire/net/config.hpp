/**
 * ipcwire - Protocol settings shared by emitter and listener.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "ipcwire/encoding/packet_encoder.hpp"
#include "ipcwire/net/header.hpp"
#include "ipcwire/net/reassembler.hpp"

namespace ipcwire::net
{

    struct NetworkConfig
    {
        std::size_t max_fragment_size{encoding::kMaxFragmentSize};
        std::string protocol_version{kProtocolVersion};
        bool enforce_version{true};
        // Malformed routes throw when set; otherwise they are logged and dropped.
        bool strict_tokens{true};
        std::chrono::milliseconds reassembly_timeout{0};
        std::size_t max_pending_messages{0};

        ReassemblyPolicy reassembly_policy() const;

        /// Throws Error{InvalidArgument} for a fragment budget below the minimum
        /// or an empty protocol version.
        void validate() const;
    };

    /// Keys missing from the file keep their defaults.
    NetworkConfig load_network_config(const std::filesystem::path &path);

    void to_json(nlohmann::json &json, const NetworkConfig &config);
    void from_json(const nlohmann::json &json, NetworkConfig &config);

} // namespace ipcwire::net
