#include "ipcwire/net/message_emitter.hpp"

#include <cstdint>
#include <limits>

#include <spdlog/spdlog.h>

#include "ipcwire/encoding/packet_encoder.hpp"
#include "ipcwire/encoding/token_codec.hpp"
#include "ipcwire/net/header.hpp"
#include "ipcwire/proto/string.hpp"

namespace ipcwire::net
{

    MessageEmitter::MessageEmitter(Transport &transport, std::size_t max_fragment_size, std::string protocol_version)
        : transport_(transport),
          max_fragment_size_(max_fragment_size),
          protocol_version_(std::move(protocol_version))
    {
    }

    Job<void> MessageEmitter::emit_buffer(std::string endpoint, ByteBuffer payload)
    {
        const auto guid = generate_guid();

        ByteBuffer endpoint_buffer;
        co_await proto::string()->serialize(endpoint, endpoint_buffer);
        const auto encoded_endpoint = co_await encoding::encode_token(endpoint_buffer);

        const auto fragments = co_await encoding::encode_packets(payload, max_fragment_size_);
        if (fragments.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw Error(ErrorCode::InvalidArgument, "payload needs too many fragments");
        }
        spdlog::debug("Emitting message {} to '{}': {} byte(s) in {} fragment(s)", guid, endpoint,
                      payload.write_position(), fragments.size());

        for (std::size_t i = 0; i < fragments.size(); ++i)
        {
            const auto header =
                make_header(guid, static_cast<std::uint32_t>(i), i + 1 == fragments.size(), protocol_version_);
            ByteBuffer header_buffer;
            co_await header_serializer()->serialize(header, header_buffer);
            const auto encoded_header = co_await encoding::encode_token(header_buffer);
            transport_.deliver(encoded_endpoint + ":" + encoded_header, fragments[i]);
        }
    }

} // namespace ipcwire::net
