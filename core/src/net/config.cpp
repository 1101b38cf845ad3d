#include "ipcwire/net/config.hpp"

#include <fstream>

#include "ipcwire/error_codes.hpp"

namespace ipcwire::net
{

    ReassemblyPolicy NetworkConfig::reassembly_policy() const
    {
        return ReassemblyPolicy{reassembly_timeout, max_pending_messages};
    }

    void NetworkConfig::validate() const
    {
        if (max_fragment_size < encoding::kMinFragmentSize)
        {
            throw Error(ErrorCode::InvalidArgument, "max_fragment_size must be at least " +
                                                        std::to_string(encoding::kMinFragmentSize));
        }
        if (protocol_version.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "protocol_version must not be empty");
        }
        if (reassembly_timeout.count() < 0)
        {
            throw Error(ErrorCode::InvalidArgument, "reassembly_timeout_ms must not be negative");
        }
    }

    NetworkConfig load_network_config(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw Error(ErrorCode::InvalidArgument, "cannot open config file " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw Error(ErrorCode::InvalidArgument, "invalid config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw Error(ErrorCode::InvalidArgument, "config file " + path.string() + " must hold a JSON object");
        }
        auto config = json.get<NetworkConfig>();
        config.validate();
        return config;
    }

    void to_json(nlohmann::json &json, const NetworkConfig &config)
    {
        json = {
            {"max_fragment_size", config.max_fragment_size},
            {"protocol_version", config.protocol_version},
            {"enforce_version", config.enforce_version},
            {"strict_tokens", config.strict_tokens},
            {"reassembly_timeout_ms", config.reassembly_timeout.count()},
            {"max_pending_messages", config.max_pending_messages},
        };
    }

    void from_json(const nlohmann::json &json, NetworkConfig &config)
    {
        const NetworkConfig defaults;
        config.max_fragment_size = json.value("max_fragment_size", defaults.max_fragment_size);
        config.protocol_version = json.value("protocol_version", defaults.protocol_version);
        config.enforce_version = json.value("enforce_version", defaults.enforce_version);
        config.strict_tokens = json.value("strict_tokens", defaults.strict_tokens);
        config.reassembly_timeout =
            std::chrono::milliseconds{json.value("reassembly_timeout_ms", defaults.reassembly_timeout.count())};
        config.max_pending_messages = json.value("max_pending_messages", defaults.max_pending_messages);
    }

} // namespace ipcwire::net
