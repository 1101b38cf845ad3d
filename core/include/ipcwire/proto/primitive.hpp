/**
 * ipcwire - Fixed-width and variable-length scalar serializers.
 *
 * Fixed-width integers and floats are written big-endian. Variable-length
 * integers use LEB128 (7 payload bits per byte, continuation bit on all but the
 * last byte); the signed variants zigzag-map first so small negatives stay short.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <variant>

#include "ipcwire/proto/serializer.hpp"

namespace ipcwire::proto
{

    namespace detail
    {

        template <typename UInt>
        void store_be(UInt value, std::span<std::byte> out) noexcept
        {
            for (std::size_t i = 0; i < sizeof(UInt); ++i)
            {
                out[i] = static_cast<std::byte>((value >> (8 * (sizeof(UInt) - 1 - i))) & 0xFFu);
            }
        }

        template <typename UInt>
        UInt load_be(std::span<const std::byte> in) noexcept
        {
            UInt value = 0;
            for (std::size_t i = 0; i < sizeof(UInt); ++i)
            {
                value = static_cast<UInt>((value << 8) | std::to_integer<UInt>(in[i]));
            }
            return value;
        }

    } // namespace detail

    class UnitSerializer final : public Serializer<std::monostate>
    {
    public:
        Job<void> serialize(const std::monostate &value, ByteBuffer &buffer) const override;
        Job<std::monostate> deserialize(ByteBuffer &buffer) const override;
        std::size_t min_wire_size() const noexcept override { return 0; }
    };

    class BoolSerializer final : public Serializer<bool>
    {
    public:
        Job<void> serialize(const bool &value, ByteBuffer &buffer) const override;
        Job<bool> deserialize(ByteBuffer &buffer) const override;
    };

    template <typename Int>
    class FixedIntSerializer final : public Serializer<Int>
    {
        static_assert(std::is_integral_v<Int>, "FixedIntSerializer requires an integer type");
        using Unsigned = std::make_unsigned_t<Int>;

    public:
        Job<void> serialize(const Int &value, ByteBuffer &buffer) const override
        {
            const auto offset = buffer.allocate(sizeof(Int));
            detail::store_be(static_cast<Unsigned>(value), buffer.bytes(offset, sizeof(Int)));
            co_return;
        }

        Job<Int> deserialize(ByteBuffer &buffer) const override
        {
            const auto offset = buffer.advance(sizeof(Int));
            const auto raw = detail::load_be<Unsigned>(buffer.bytes(offset, sizeof(Int)));
            co_return static_cast<Int>(raw);
        }

        std::size_t min_wire_size() const noexcept override { return sizeof(Int); }
    };

    using Int8Serializer = FixedIntSerializer<std::int8_t>;
    using Int16Serializer = FixedIntSerializer<std::int16_t>;
    using Int32Serializer = FixedIntSerializer<std::int32_t>;
    using UInt8Serializer = FixedIntSerializer<std::uint8_t>;
    using UInt16Serializer = FixedIntSerializer<std::uint16_t>;
    using UInt32Serializer = FixedIntSerializer<std::uint32_t>;

    class Float32Serializer final : public Serializer<float>
    {
    public:
        Job<void> serialize(const float &value, ByteBuffer &buffer) const override;
        Job<float> deserialize(ByteBuffer &buffer) const override;
        std::size_t min_wire_size() const noexcept override { return 4; }
    };

    class Float64Serializer final : public Serializer<double>
    {
    public:
        Job<void> serialize(const double &value, ByteBuffer &buffer) const override;
        Job<double> deserialize(ByteBuffer &buffer) const override;
        std::size_t min_wire_size() const noexcept override { return 8; }
    };

    /// LEB128, at most 5 bytes.
    class VarUInt32Serializer final : public Serializer<std::uint32_t>
    {
    public:
        Job<void> serialize(const std::uint32_t &value, ByteBuffer &buffer) const override;
        Job<std::uint32_t> deserialize(ByteBuffer &buffer) const override;
    };

    class VarInt32Serializer final : public Serializer<std::int32_t>
    {
    public:
        Job<void> serialize(const std::int32_t &value, ByteBuffer &buffer) const override;
        Job<std::int32_t> deserialize(ByteBuffer &buffer) const override;

    private:
        VarUInt32Serializer unsigned_;
    };

    /// LEB128, at most 10 bytes.
    class VarUInt64Serializer final : public Serializer<std::uint64_t>
    {
    public:
        Job<void> serialize(const std::uint64_t &value, ByteBuffer &buffer) const override;
        Job<std::uint64_t> deserialize(ByteBuffer &buffer) const override;
    };

    class VarInt64Serializer final : public Serializer<std::int64_t>
    {
    public:
        Job<void> serialize(const std::int64_t &value, ByteBuffer &buffer) const override;
        Job<std::int64_t> deserialize(ByteBuffer &buffer) const override;

    private:
        VarUInt64Serializer unsigned_;
    };

    constexpr std::uint32_t zigzag_encode(std::int32_t value) noexcept
    {
        return (static_cast<std::uint32_t>(value) << 1) ^ static_cast<std::uint32_t>(value >> 31);
    }

    constexpr std::int32_t zigzag_decode(std::uint32_t value) noexcept
    {
        return static_cast<std::int32_t>((value >> 1) ^ (~(value & 1u) + 1u));
    }

    constexpr std::uint64_t zigzag_encode(std::int64_t value) noexcept
    {
        return (static_cast<std::uint64_t>(value) << 1) ^ static_cast<std::uint64_t>(value >> 63);
    }

    constexpr std::int64_t zigzag_decode(std::uint64_t value) noexcept
    {
        return static_cast<std::int64_t>((value >> 1) ^ (~(value & 1u) + 1u));
    }

    // Shared stateless instances.
    SerializerPtr<std::monostate> unit();
    SerializerPtr<bool> boolean();
    SerializerPtr<std::int8_t> int8();
    SerializerPtr<std::int16_t> int16();
    SerializerPtr<std::int32_t> int32();
    SerializerPtr<std::uint8_t> uint8();
    SerializerPtr<std::uint16_t> uint16();
    SerializerPtr<std::uint32_t> uint32();
    SerializerPtr<float> float32();
    SerializerPtr<double> float64();
    SerializerPtr<std::uint32_t> var_uint32();
    SerializerPtr<std::int32_t> var_int32();
    SerializerPtr<std::uint64_t> var_uint64();
    SerializerPtr<std::int64_t> var_int64();

} // namespace ipcwire::proto
