#include "ipcwire/net/network.hpp"

#include <exception>
#include <vector>

#include <spdlog/spdlog.h>

#include "ipcwire/encoding/token_codec.hpp"
#include "ipcwire/error_codes.hpp"
#include "ipcwire/net/header.hpp"
#include "ipcwire/proto/string.hpp"

namespace ipcwire::net
{

    namespace
    {
        NetworkConfig validated(NetworkConfig config)
        {
            config.validate();
            return config;
        }
    } // namespace

    Network::Network(Transport &transport, Scheduler &scheduler, NetworkConfig config)
        : scheduler_(scheduler),
          config_(validated(std::move(config))),
          emitter_(transport, config_.max_fragment_size, config_.protocol_version),
          listener_(endpoints_, config_.reassembly_policy())
    {
    }

    Network::~Network()
    {
        close();
    }

    void Network::reject(const std::string &route, const std::string &reason) const
    {
        if (config_.strict_tokens)
        {
            throw Error(ErrorCode::MalformedToken, reason + " in route '" + route + "'");
        }
        spdlog::warn("Dropping fragment with route '{}': {}", route, reason);
    }

    Job<std::optional<ByteBuffer>> Network::decode_route_token(std::string token, std::string_view part)
    {
        if (config_.strict_tokens)
        {
            co_return co_await encoding::decode_token(std::move(token));
        }
        auto buffer = co_await encoding::try_decode_token(token);
        if (!buffer)
        {
            spdlog::warn("Dropping fragment with malformed {} token '{}'", part, token);
        }
        co_return buffer;
    }

    Job<void> Network::handle_message(std::string route, std::string payload)
    {
        const auto separator = route.find(':');
        if (separator == std::string::npos)
        {
            reject(route, "missing ':' separator");
            co_return;
        }

        auto endpoint_buffer = co_await decode_route_token(route.substr(0, separator), "endpoint");
        if (!endpoint_buffer)
        {
            co_return;
        }
        const auto endpoint = co_await proto::string()->deserialize(*endpoint_buffer);

        const auto listeners = endpoints_.listeners(endpoint);
        if (listeners.empty())
        {
            spdlog::trace("No listeners on endpoint '{}'", endpoint);
            co_return;
        }

        auto header_buffer = co_await decode_route_token(route.substr(separator + 1), "header");
        if (!header_buffer)
        {
            co_return;
        }
        const auto header = co_await header_serializer()->deserialize(*header_buffer);

        if (config_.enforce_version && header.version != config_.protocol_version)
        {
            spdlog::warn("Dropping fragment {} of message {} on '{}': version '{}' does not match '{}'", header.index,
                         header.guid, endpoint, header.version, config_.protocol_version);
            co_return;
        }

        std::vector<std::exception_ptr> failures;
        for (const auto &listener : listeners)
        {
            try
            {
                co_await (*listener)(header, payload);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Listener on endpoint '{}' failed: {}", endpoint, ex.what());
                failures.push_back(std::current_exception());
            }
        }
        if (!failures.empty())
        {
            throw DispatchError(endpoint, std::move(failures));
        }
    }

    void Network::on_message(std::string route, std::string payload)
    {
        auto name = "message " + route;
        scheduler_.spawn(handle_message(std::move(route), std::move(payload)), std::move(name));
    }

    std::size_t Network::evict_expired(Reassembler::Clock::time_point now)
    {
        return listener_.evict_expired(now);
    }

    std::size_t Network::pending_messages() const
    {
        return listener_.pending_messages();
    }

    void Network::close()
    {
        listener_.close();
    }

} // namespace ipcwire::net
