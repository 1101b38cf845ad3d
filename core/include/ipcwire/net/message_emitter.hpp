/**
 * ipcwire - Serializes a value and hands its fragments to the transport.
 */
#pragma once

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

#include "ipcwire/byte_buffer.hpp"
#include "ipcwire/error_codes.hpp"
#include "ipcwire/job.hpp"
#include "ipcwire/net/transport.hpp"
#include "ipcwire/proto/serializer.hpp"

namespace ipcwire::net
{

    /// Delivers one `encodedEndpoint:encodedHeader` route per fragment, in index
    /// order. The transport must outlive every job returned here.
    class MessageEmitter
    {
    public:
        MessageEmitter(Transport &transport, std::size_t max_fragment_size, std::string protocol_version);

        template <typename T>
        Job<void> emit(std::string endpoint, proto::SerializerPtr<T> serializer, std::type_identity_t<T> value)
        {
            if (!serializer)
            {
                throw Error(ErrorCode::MissingSerializer, "no serializer for endpoint '" + endpoint + "'");
            }
            ByteBuffer payload;
            co_await serializer->serialize(value, payload);
            co_await emit_buffer(std::move(endpoint), std::move(payload));
        }

        /// Sends an already serialized payload.
        Job<void> emit_buffer(std::string endpoint, ByteBuffer payload);

        std::size_t max_fragment_size() const noexcept { return max_fragment_size_; }

    private:
        Transport &transport_;
        std::size_t max_fragment_size_;
        std::string protocol_version_;
    };

} // namespace ipcwire::net
