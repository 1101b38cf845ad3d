#include "ipcwire/proto/string.hpp"

#include <limits>
#include <memory>

#include "ipcwire/encoding/text.hpp"
#include "ipcwire/error_codes.hpp"

namespace ipcwire::proto
{

    namespace
    {
        std::uint32_t checked_length(std::size_t size, const char *what)
        {
            if (size > std::numeric_limits<std::uint32_t>::max())
            {
                throw Error(ErrorCode::InvalidArgument, std::string(what) + " too long to serialize");
            }
            return static_cast<std::uint32_t>(size);
        }

        // Every element occupies at least one byte, so a larger count can never be satisfied.
        void require_available(const ByteBuffer &buffer, std::uint32_t count)
        {
            if (count > buffer.available())
            {
                throw Error(ErrorCode::BufferUnderflow, "declared length " + std::to_string(count) + ", available " +
                                                            std::to_string(buffer.available()));
            }
        }
    } // namespace

    Job<void> StringSerializer::serialize(const std::string &value, ByteBuffer &buffer) const
    {
        const auto units = encoding::utf8_to_utf16(value);
        const auto length = checked_length(units.size(), "string");
        co_await varint_.serialize(length, buffer);
        for (const char16_t unit : units)
        {
            const std::uint32_t code = unit;
            co_await varint_.serialize(code, buffer);
            co_yield checkpoint;
        }
    }

    Job<std::string> StringSerializer::deserialize(ByteBuffer &buffer) const
    {
        const auto length = co_await varint_.deserialize(buffer);
        require_available(buffer, length);
        std::u16string units;
        units.reserve(length);
        for (std::uint32_t i = 0; i < length; ++i)
        {
            const auto code = co_await varint_.deserialize(buffer);
            if (code > 0xFFFF)
            {
                throw Error(ErrorCode::InvalidText, "code unit " + std::to_string(code) + " out of range");
            }
            units.push_back(static_cast<char16_t>(code));
            co_yield checkpoint;
        }
        co_return encoding::utf16_to_utf8(units);
    }

    Job<void> BytesSerializer::serialize(const std::vector<std::byte> &value, ByteBuffer &buffer) const
    {
        const auto length = checked_length(value.size(), "byte array");
        co_await varint_.serialize(length, buffer);
        buffer.write_bytes(value);
    }

    Job<std::vector<std::byte>> BytesSerializer::deserialize(ByteBuffer &buffer) const
    {
        const auto length = co_await varint_.deserialize(buffer);
        co_return buffer.read_bytes(length);
    }

    Job<void> TimestampSerializer::serialize(const std::chrono::system_clock::time_point &value,
                                             ByteBuffer &buffer) const
    {
        const std::chrono::duration<double, std::milli> millis = value.time_since_epoch();
        const double count = millis.count();
        co_await float64_.serialize(count, buffer);
    }

    Job<std::chrono::system_clock::time_point> TimestampSerializer::deserialize(ByteBuffer &buffer) const
    {
        const auto count = co_await float64_.deserialize(buffer);
        const std::chrono::duration<double, std::milli> millis{count};
        co_return std::chrono::system_clock::time_point{
            std::chrono::duration_cast<std::chrono::system_clock::duration>(millis)};
    }

    SerializerPtr<std::string> string()
    {
        static const auto instance = std::make_shared<const StringSerializer>();
        return instance;
    }

    SerializerPtr<std::vector<std::byte>> bytes()
    {
        static const auto instance = std::make_shared<const BytesSerializer>();
        return instance;
    }

    SerializerPtr<std::chrono::system_clock::time_point> timestamp()
    {
        static const auto instance = std::make_shared<const TimestampSerializer>();
        return instance;
    }

} // namespace ipcwire::proto
