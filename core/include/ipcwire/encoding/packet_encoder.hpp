/**
 * ipcwire - Splits a byte buffer into bounded text fragments and joins them back.
 *
 * Bytes are paired into 16-bit units (first byte low, second byte high). A unit
 * whose high byte is zero travels as two uppercase hex digits; any other unit
 * travels as a single character in a 2-3 byte UTF-8 style sequence. The cost of a
 * unit equals the number of bytes it adds to the fragment, so `fragment.size()`
 * is always within the budget.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ipcwire/byte_buffer.hpp"
#include "ipcwire/job.hpp"

namespace ipcwire::encoding
{

    inline constexpr std::size_t kMaxFragmentSize = 2048;

    /// Largest cost of a single unit; any buffer fits a budget of at least this.
    inline constexpr std::size_t kMinFragmentSize = 3;

    /// Follows the hex pair of an odd trailing byte: the pair carries one byte, not two.
    inline constexpr char kPadMarker = '~';

    std::size_t unit_cost(char16_t unit) noexcept;

    /// Always yields at least one fragment; an empty buffer gives {""}.
    /// Throws Error{InvalidArgument} when a single unit costs more than `max_size`,
    /// which can only happen below kMinFragmentSize.
    Job<std::vector<std::string>> encode_packets(const ByteBuffer &buffer, std::size_t max_size = kMaxFragmentSize);

    /// Throws Error{MalformedFragment} on text the encoder never produces.
    Job<ByteBuffer> decode_packets(std::vector<std::string> fragments);

} // namespace ipcwire::encoding
