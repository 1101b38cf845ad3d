/**
 * ipcwire - `(0x...)` tokens carrying endpoint names and fragment headers inside a route.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ipcwire/byte_buffer.hpp"
#include "ipcwire/job.hpp"

namespace ipcwire::encoding
{

    inline constexpr std::string_view kTokenPrefix = "(0x";
    inline constexpr char kTokenSuffix = ')';

    /// `(0x` + two uppercase hex digits per written byte + `)`.
    Job<std::string> encode_token(const ByteBuffer &buffer);

    /// Throws Error{MalformedToken} for a missing wrapper, an odd digit count or a
    /// non-hex digit.
    Job<ByteBuffer> decode_token(std::string token);

    /// Same as decode_token, but reports malformed input as std::nullopt.
    Job<std::optional<ByteBuffer>> try_decode_token(std::string token);

} // namespace ipcwire::encoding
