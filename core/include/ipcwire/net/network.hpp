/**
 * ipcwire - Context object tying emitter, listener and endpoint registry to one
 * transport and scheduler.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "ipcwire/byte_buffer.hpp"
#include "ipcwire/job.hpp"
#include "ipcwire/net/config.hpp"
#include "ipcwire/net/endpoint_manager.hpp"
#include "ipcwire/net/message_emitter.hpp"
#include "ipcwire/net/message_listener.hpp"
#include "ipcwire/net/transport.hpp"
#include "ipcwire/scheduler.hpp"

namespace ipcwire::net
{

    /// Transport and scheduler must outlive the Network, and the Network must
    /// outlive every job it spawned.
    class Network
    {
    public:
        Network(Transport &transport, Scheduler &scheduler, NetworkConfig config = {});
        ~Network();

        Network(const Network &) = delete;
        Network &operator=(const Network &) = delete;

        template <typename T>
        Job<void> emit(std::string endpoint, proto::SerializerPtr<T> serializer, std::type_identity_t<T> value)
        {
            return emitter_.emit<T>(std::move(endpoint), std::move(serializer), std::move(value));
        }

        /// Spawns `emit` on the scheduler.
        template <typename T>
        void send(std::string endpoint, proto::SerializerPtr<T> serializer, std::type_identity_t<T> value)
        {
            auto name = "emit " + endpoint;
            scheduler_.spawn(emit<T>(std::move(endpoint), std::move(serializer), std::move(value)), std::move(name));
        }

        template <typename T, typename Callback>
        Unsubscribe listen(const std::string &endpoint, proto::SerializerPtr<T> deserializer, Callback callback)
        {
            return listener_.listen<T>(endpoint, std::move(deserializer), std::move(callback));
        }

        /// Routes one inbound fragment to the listeners of its endpoint. Every
        /// listener runs even if an earlier one throws; the failures are then
        /// raised together as DispatchError.
        Job<void> handle_message(std::string route, std::string payload);

        /// Spawns handle_message on the scheduler.
        void on_message(std::string route, std::string payload);

        std::size_t evict_expired(Reassembler::Clock::time_point now = Reassembler::Clock::now());
        std::size_t pending_messages() const;

        /// Unregisters every listener.
        void close();

        const NetworkConfig &config() const noexcept { return config_; }
        EndpointManager &endpoints() noexcept { return endpoints_; }

    private:
        Job<std::optional<ByteBuffer>> decode_route_token(std::string token, std::string_view part);
        void reject(const std::string &route, const std::string &reason) const;

        Scheduler &scheduler_;
        NetworkConfig config_;
        EndpointManager endpoints_;
        MessageEmitter emitter_;
        MessageListener listener_;
    };

} // namespace ipcwire::net
