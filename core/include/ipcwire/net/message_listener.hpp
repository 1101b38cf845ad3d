/**
 * ipcwire - Reassembles fragments into typed values for endpoint callbacks.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "ipcwire/encoding/packet_encoder.hpp"
#include "ipcwire/error_codes.hpp"
#include "ipcwire/job.hpp"
#include "ipcwire/net/endpoint_manager.hpp"
#include "ipcwire/net/reassembler.hpp"
#include "ipcwire/proto/serializer.hpp"

namespace ipcwire::net
{

    namespace detail
    {

        template <typename T, typename Callback>
        Job<void> receive_fragment(std::shared_ptr<Reassembler> reassembler, proto::SerializerPtr<T> deserializer,
                                   std::shared_ptr<Callback> callback, FragmentHeader header, std::string fragment)
        {
            auto fragments = reassembler->accept(header, std::move(fragment));
            if (!fragments)
            {
                co_return;
            }
            auto buffer = co_await encoding::decode_packets(std::move(*fragments));
            auto value = co_await deserializer->deserialize(buffer);
            if constexpr (std::is_same_v<std::invoke_result_t<Callback &, T>, Job<void>>)
            {
                co_await (*callback)(std::move(value));
            }
            else
            {
                (*callback)(std::move(value));
            }
        }

    } // namespace detail

    /// Each `listen` call owns a separate Reassembler, so two registrations on the
    /// same endpoint reassemble independently.
    class MessageListener
    {
    public:
        MessageListener(EndpointManager &endpoints, ReassemblyPolicy policy);

        /// `callback` is invoked with each completed value and may return
        /// Job<void> to keep suspending on the scheduler.
        template <typename T, typename Callback>
        Unsubscribe listen(const std::string &endpoint, proto::SerializerPtr<T> deserializer, Callback callback)
        {
            if (!deserializer)
            {
                throw Error(ErrorCode::MissingSerializer, "no deserializer for endpoint '" + endpoint + "'");
            }
            auto reassembler = std::make_shared<Reassembler>(policy_);
            track(reassembler);
            auto shared_callback = std::make_shared<Callback>(std::move(callback));
            return endpoints_.register_listener(
                endpoint,
                [reassembler, deserializer, shared_callback](FragmentHeader header, std::string fragment)
                {
                    return detail::receive_fragment<T, Callback>(reassembler, deserializer, shared_callback,
                                                                 std::move(header), std::move(fragment));
                });
        }

        std::size_t evict_expired(Reassembler::Clock::time_point now = Reassembler::Clock::now());

        /// Incomplete messages across every live registration.
        std::size_t pending_messages() const;

        /// Unregisters every listener on every endpoint.
        void close();

    private:
        void track(const std::shared_ptr<Reassembler> &reassembler);

        EndpointManager &endpoints_;
        ReassemblyPolicy policy_;
        std::vector<std::weak_ptr<Reassembler>> reassemblers_;
    };

} // namespace ipcwire::net
