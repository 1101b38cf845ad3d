/**
 * ipcwire - Length-prefixed text and raw byte serializers.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "ipcwire/proto/primitive.hpp"

namespace ipcwire::proto
{

    /// Count of UTF-16 code units, then one varuint32 per code unit. Values are
    /// UTF-8 on the C++ side.
    class StringSerializer final : public Serializer<std::string>
    {
    public:
        Job<void> serialize(const std::string &value, ByteBuffer &buffer) const override;
        Job<std::string> deserialize(ByteBuffer &buffer) const override;

    private:
        VarUInt32Serializer varint_;
    };

    /// varuint32 length followed by the raw bytes.
    class BytesSerializer final : public Serializer<std::vector<std::byte>>
    {
    public:
        Job<void> serialize(const std::vector<std::byte> &value, ByteBuffer &buffer) const override;
        Job<std::vector<std::byte>> deserialize(ByteBuffer &buffer) const override;

    private:
        VarUInt32Serializer varint_;
    };

    /// float64 milliseconds since the Unix epoch.
    class TimestampSerializer final : public Serializer<std::chrono::system_clock::time_point>
    {
    public:
        Job<void> serialize(const std::chrono::system_clock::time_point &value, ByteBuffer &buffer) const override;
        Job<std::chrono::system_clock::time_point> deserialize(ByteBuffer &buffer) const override;

    private:
        Float64Serializer float64_;
    };

    SerializerPtr<std::string> string();
    SerializerPtr<std::vector<std::byte>> bytes();
    SerializerPtr<std::chrono::system_clock::time_point> timestamp();

} // namespace ipcwire::proto
