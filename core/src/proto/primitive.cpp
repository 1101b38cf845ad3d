#include "ipcwire/proto/primitive.hpp"

#include <bit>
#include <memory>
#include <string>

#include "ipcwire/error_codes.hpp"

namespace ipcwire::proto
{

    namespace
    {
        constexpr std::uint8_t kPayloadMask = 0x7F;
        constexpr std::uint8_t kContinuationBit = 0x80;

        template <typename UInt>
        Job<void> write_leb128(UInt value, ByteBuffer &buffer)
        {
            while (value >= kContinuationBit)
            {
                buffer.write_byte(static_cast<std::uint8_t>((value & kPayloadMask) | kContinuationBit));
                value >>= 7;
                co_yield checkpoint;
            }
            buffer.write_byte(static_cast<std::uint8_t>(value));
        }

        template <typename UInt>
        Job<UInt> read_leb128(ByteBuffer &buffer)
        {
            constexpr std::size_t kBits = sizeof(UInt) * 8;
            constexpr std::size_t kMaxBytes = (kBits + 6) / 7;

            UInt value = 0;
            for (std::size_t i = 0; i < kMaxBytes; ++i)
            {
                const auto byte = buffer.read_byte();
                const auto shift = 7 * i;
                const auto payload = static_cast<UInt>(byte & kPayloadMask);
                if (i + 1 == kMaxBytes && (payload >> (kBits - shift)) != 0)
                {
                    throw Error(ErrorCode::InvalidVarint,
                                "value exceeds " + std::to_string(kBits) + " bits");
                }
                value |= static_cast<UInt>(payload << shift);
                if ((byte & kContinuationBit) == 0)
                {
                    co_return value;
                }
                co_yield checkpoint;
            }
            throw Error(ErrorCode::InvalidVarint,
                        "no terminating byte within " + std::to_string(kMaxBytes) + " bytes");
        }
    } // namespace

    Job<void> UnitSerializer::serialize(const std::monostate & /*value*/, ByteBuffer & /*buffer*/) const
    {
        co_return;
    }

    Job<std::monostate> UnitSerializer::deserialize(ByteBuffer & /*buffer*/) const
    {
        co_return std::monostate{};
    }

    Job<void> BoolSerializer::serialize(const bool &value, ByteBuffer &buffer) const
    {
        buffer.write_byte(value ? 1 : 0);
        co_return;
    }

    Job<bool> BoolSerializer::deserialize(ByteBuffer &buffer) const
    {
        co_return buffer.read_byte() != 0;
    }

    Job<void> Float32Serializer::serialize(const float &value, ByteBuffer &buffer) const
    {
        const auto offset = buffer.allocate(sizeof(float));
        detail::store_be(std::bit_cast<std::uint32_t>(value), buffer.bytes(offset, sizeof(float)));
        co_return;
    }

    Job<float> Float32Serializer::deserialize(ByteBuffer &buffer) const
    {
        const auto offset = buffer.advance(sizeof(float));
        co_return std::bit_cast<float>(detail::load_be<std::uint32_t>(buffer.bytes(offset, sizeof(float))));
    }

    Job<void> Float64Serializer::serialize(const double &value, ByteBuffer &buffer) const
    {
        const auto offset = buffer.allocate(sizeof(double));
        detail::store_be(std::bit_cast<std::uint64_t>(value), buffer.bytes(offset, sizeof(double)));
        co_return;
    }

    Job<double> Float64Serializer::deserialize(ByteBuffer &buffer) const
    {
        const auto offset = buffer.advance(sizeof(double));
        co_return std::bit_cast<double>(detail::load_be<std::uint64_t>(buffer.bytes(offset, sizeof(double))));
    }

    Job<void> VarUInt32Serializer::serialize(const std::uint32_t &value, ByteBuffer &buffer) const
    {
        co_await write_leb128<std::uint32_t>(value, buffer);
    }

    Job<std::uint32_t> VarUInt32Serializer::deserialize(ByteBuffer &buffer) const
    {
        co_return co_await read_leb128<std::uint32_t>(buffer);
    }

    Job<void> VarInt32Serializer::serialize(const std::int32_t &value, ByteBuffer &buffer) const
    {
        const auto encoded = zigzag_encode(value);
        co_await unsigned_.serialize(encoded, buffer);
    }

    Job<std::int32_t> VarInt32Serializer::deserialize(ByteBuffer &buffer) const
    {
        const auto encoded = co_await unsigned_.deserialize(buffer);
        co_return zigzag_decode(encoded);
    }

    Job<void> VarUInt64Serializer::serialize(const std::uint64_t &value, ByteBuffer &buffer) const
    {
        co_await write_leb128<std::uint64_t>(value, buffer);
    }

    Job<std::uint64_t> VarUInt64Serializer::deserialize(ByteBuffer &buffer) const
    {
        co_return co_await read_leb128<std::uint64_t>(buffer);
    }

    Job<void> VarInt64Serializer::serialize(const std::int64_t &value, ByteBuffer &buffer) const
    {
        const auto encoded = zigzag_encode(value);
        co_await unsigned_.serialize(encoded, buffer);
    }

    Job<std::int64_t> VarInt64Serializer::deserialize(ByteBuffer &buffer) const
    {
        const auto encoded = co_await unsigned_.deserialize(buffer);
        co_return zigzag_decode(encoded);
    }

    SerializerPtr<std::monostate> unit()
    {
        static const auto instance = std::make_shared<const UnitSerializer>();
        return instance;
    }

    SerializerPtr<bool> boolean()
    {
        static const auto instance = std::make_shared<const BoolSerializer>();
        return instance;
    }

    SerializerPtr<std::int8_t> int8()
    {
        static const auto instance = std::make_shared<const Int8Serializer>();
        return instance;
    }

    SerializerPtr<std::int16_t> int16()
    {
        static const auto instance = std::make_shared<const Int16Serializer>();
        return instance;
    }

    SerializerPtr<std::int32_t> int32()
    {
        static const auto instance = std::make_shared<const Int32Serializer>();
        return instance;
    }

    SerializerPtr<std::uint8_t> uint8()
    {
        static const auto instance = std::make_shared<const UInt8Serializer>();
        return instance;
    }

    SerializerPtr<std::uint16_t> uint16()
    {
        static const auto instance = std::make_shared<const UInt16Serializer>();
        return instance;
    }

    SerializerPtr<std::uint32_t> uint32()
    {
        static const auto instance = std::make_shared<const UInt32Serializer>();
        return instance;
    }

    SerializerPtr<float> float32()
    {
        static const auto instance = std::make_shared<const Float32Serializer>();
        return instance;
    }

    SerializerPtr<double> float64()
    {
        static const auto instance = std::make_shared<const Float64Serializer>();
        return instance;
    }

    SerializerPtr<std::uint32_t> var_uint32()
    {
        static const auto instance = std::make_shared<const VarUInt32Serializer>();
        return instance;
    }

    SerializerPtr<std::int32_t> var_int32()
    {
        static const auto instance = std::make_shared<const VarInt32Serializer>();
        return instance;
    }

    SerializerPtr<std::uint64_t> var_uint64()
    {
        static const auto instance = std::make_shared<const VarUInt64Serializer>();
        return instance;
    }

    SerializerPtr<std::int64_t> var_int64()
    {
        static const auto instance = std::make_shared<const VarInt64Serializer>();
        return instance;
    }

} // namespace ipcwire::proto
