#include "ipcwire/encoding/token_codec.hpp"

#include <cstdint>
#include <string_view>

#include "ipcwire/encoding/text.hpp"
#include "ipcwire/error_codes.hpp"

namespace ipcwire::encoding
{

    namespace
    {
        // Returns the digits between the wrapper, or an empty optional with `reason` set.
        std::optional<std::string_view> token_digits(std::string_view token, std::string &reason)
        {
            if (token.size() < kTokenPrefix.size() + 1 || token.substr(0, kTokenPrefix.size()) != kTokenPrefix ||
                token.back() != kTokenSuffix)
            {
                reason = "missing (0x...) wrapper";
                return std::nullopt;
            }
            auto digits = token.substr(kTokenPrefix.size(), token.size() - kTokenPrefix.size() - 1);
            if (digits.size() % 2 != 0)
            {
                reason = "odd number of hex digits";
                return std::nullopt;
            }
            for (std::size_t i = 0; i < digits.size(); ++i)
            {
                if (hex_value(digits[i]) < 0)
                {
                    reason = "non-hex digit at offset " + std::to_string(i);
                    return std::nullopt;
                }
            }
            return digits;
        }

        Job<ByteBuffer> parse_digits(std::string_view digits)
        {
            ByteBuffer buffer(digits.size() / 2 + 1);
            for (std::size_t i = 0; i < digits.size(); i += 2)
            {
                const int value = (hex_value(digits[i]) << 4) | hex_value(digits[i + 1]);
                buffer.write_byte(static_cast<std::uint8_t>(value));
                co_yield checkpoint;
            }
            buffer.reset_read();
            co_return buffer;
        }
    } // namespace

    Job<std::string> encode_token(const ByteBuffer &buffer)
    {
        const auto bytes = buffer.view();
        std::string token(kTokenPrefix);
        token.reserve(kTokenPrefix.size() + bytes.size() * 2 + 1);
        for (const auto byte : bytes)
        {
            const auto value = std::to_integer<unsigned>(byte);
            token.push_back(hex_digit(value >> 4));
            token.push_back(hex_digit(value));
            co_yield checkpoint;
        }
        token.push_back(kTokenSuffix);
        co_return token;
    }

    Job<ByteBuffer> decode_token(std::string token)
    {
        std::string reason;
        const auto digits = token_digits(token, reason);
        if (!digits)
        {
            throw Error(ErrorCode::MalformedToken, reason + " in token '" + token + "'");
        }
        co_return co_await parse_digits(*digits);
    }

    Job<std::optional<ByteBuffer>> try_decode_token(std::string token)
    {
        std::string reason;
        const auto digits = token_digits(token, reason);
        if (!digits)
        {
            co_return std::nullopt;
        }
        co_return co_await parse_digits(*digits);
    }

} // namespace ipcwire::encoding
