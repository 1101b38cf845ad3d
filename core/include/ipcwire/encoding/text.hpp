/**
 * ipcwire - UTF-8 / UTF-16 conversion and hex digit helpers.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace ipcwire::encoding
{

    /// Throws Error{InvalidText} on malformed UTF-8.
    std::u16string utf8_to_utf16(std::string_view text);

    /// Throws Error{InvalidText} on an unpaired surrogate.
    std::string utf16_to_utf8(std::u16string_view units);

    /// Bytes taken by a single 16-bit code unit written as a 1-3 byte UTF-8 style
    /// sequence. Surrogate values are written like any other value.
    std::size_t code_unit_width(char16_t unit) noexcept;

    void append_code_unit(std::string &out, char16_t unit);

    /// Reads one code unit written by append_code_unit starting at `pos` and moves
    /// `pos` past it. Throws Error{MalformedFragment} on an invalid sequence.
    char16_t next_code_unit(std::string_view text, std::size_t &pos);

    char hex_digit(unsigned nibble) noexcept;

    /// Value of an upper- or lowercase hex digit, -1 otherwise.
    int hex_value(char ch) noexcept;

    /// Uppercase, two digits per byte.
    std::string to_hex(std::span<const std::byte> bytes);

} // namespace ipcwire::encoding
