#include "ipcwire/encoding/text.hpp"

#include <cstdint>

#include "ipcwire/error_codes.hpp"

namespace ipcwire::encoding
{

    namespace
    {
        constexpr char kHexDigits[] = "0123456789ABCDEF";

        constexpr char32_t kMaxCodePoint = 0x10FFFF;
        constexpr char16_t kHighSurrogateMin = 0xD800;
        constexpr char16_t kLowSurrogateMin = 0xDC00;
        constexpr char16_t kSurrogateMax = 0xDFFF;

        bool is_high_surrogate(char32_t value) noexcept
        {
            return value >= kHighSurrogateMin && value < kLowSurrogateMin;
        }

        bool is_low_surrogate(char32_t value) noexcept
        {
            return value >= kLowSurrogateMin && value <= kSurrogateMax;
        }

        bool is_continuation(unsigned char byte) noexcept
        {
            return (byte & 0xC0u) == 0x80u;
        }

        void append_utf8(std::string &out, char32_t code_point)
        {
            if (code_point <= 0x7F)
            {
                out.push_back(static_cast<char>(code_point));
            }
            else if (code_point <= 0x7FF)
            {
                out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
            else if (code_point <= 0xFFFF)
            {
                out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
        }

        // Decodes one UTF-8 sequence. Returns the sequence length, 0 when invalid.
        std::size_t decode_utf8(std::string_view text, std::size_t pos, char32_t &code_point) noexcept
        {
            const auto lead = static_cast<unsigned char>(text[pos]);
            std::size_t length = 0;
            char32_t minimum = 0;
            if (lead < 0x80)
            {
                code_point = lead;
                return 1;
            }
            if ((lead & 0xE0u) == 0xC0u)
            {
                length = 2;
                minimum = 0x80;
                code_point = lead & 0x1Fu;
            }
            else if ((lead & 0xF0u) == 0xE0u)
            {
                length = 3;
                minimum = 0x800;
                code_point = lead & 0x0Fu;
            }
            else if ((lead & 0xF8u) == 0xF0u)
            {
                length = 4;
                minimum = 0x10000;
                code_point = lead & 0x07u;
            }
            else
            {
                return 0;
            }
            if (text.size() - pos < length)
            {
                return 0;
            }
            for (std::size_t i = 1; i < length; ++i)
            {
                const auto byte = static_cast<unsigned char>(text[pos + i]);
                if (!is_continuation(byte))
                {
                    return 0;
                }
                code_point = (code_point << 6) | (byte & 0x3Fu);
            }
            if (code_point < minimum)
            {
                return 0;
            }
            return length;
        }
    } // namespace

    std::u16string utf8_to_utf16(std::string_view text)
    {
        std::u16string units;
        units.reserve(text.size());
        std::size_t pos = 0;
        while (pos < text.size())
        {
            char32_t code_point = 0;
            const auto length = decode_utf8(text, pos, code_point);
            if (length == 0 || code_point > kMaxCodePoint || is_high_surrogate(code_point) ||
                is_low_surrogate(code_point))
            {
                throw Error(ErrorCode::InvalidText, "invalid UTF-8 sequence at byte " + std::to_string(pos));
            }
            pos += length;
            if (code_point > 0xFFFF)
            {
                const auto offset = code_point - 0x10000;
                units.push_back(static_cast<char16_t>(kHighSurrogateMin + (offset >> 10)));
                units.push_back(static_cast<char16_t>(kLowSurrogateMin + (offset & 0x3FF)));
            }
            else
            {
                units.push_back(static_cast<char16_t>(code_point));
            }
        }
        return units;
    }

    std::string utf16_to_utf8(std::u16string_view units)
    {
        std::string text;
        text.reserve(units.size());
        for (std::size_t i = 0; i < units.size(); ++i)
        {
            const char32_t unit = units[i];
            if (is_low_surrogate(unit))
            {
                throw Error(ErrorCode::InvalidText, "unpaired low surrogate at index " + std::to_string(i));
            }
            if (is_high_surrogate(unit))
            {
                if (i + 1 >= units.size() || !is_low_surrogate(units[i + 1]))
                {
                    throw Error(ErrorCode::InvalidText, "unpaired high surrogate at index " + std::to_string(i));
                }
                const char32_t low = units[++i];
                append_utf8(text, 0x10000 + ((unit - kHighSurrogateMin) << 10) + (low - kLowSurrogateMin));
                continue;
            }
            append_utf8(text, unit);
        }
        return text;
    }

    std::size_t code_unit_width(char16_t unit) noexcept
    {
        if (unit <= 0x7F)
        {
            return 1;
        }
        return unit <= 0x7FF ? 2 : 3;
    }

    void append_code_unit(std::string &out, char16_t unit)
    {
        append_utf8(out, unit);
    }

    char16_t next_code_unit(std::string_view text, std::size_t &pos)
    {
        char32_t code_point = 0;
        const auto length = decode_utf8(text, pos, code_point);
        if (length == 0 || length > 3)
        {
            throw Error(ErrorCode::MalformedFragment, "invalid character sequence at byte " + std::to_string(pos));
        }
        pos += length;
        return static_cast<char16_t>(code_point);
    }

    char hex_digit(unsigned nibble) noexcept
    {
        return kHexDigits[nibble & 0x0Fu];
    }

    int hex_value(char ch) noexcept
    {
        if (ch >= '0' && ch <= '9')
        {
            return ch - '0';
        }
        if (ch >= 'A' && ch <= 'F')
        {
            return ch - 'A' + 10;
        }
        if (ch >= 'a' && ch <= 'f')
        {
            return ch - 'a' + 10;
        }
        return -1;
    }

    std::string to_hex(std::span<const std::byte> bytes)
    {
        std::string result;
        result.resize(bytes.size() * 2);
        for (std::size_t i = 0; i < bytes.size(); ++i)
        {
            const auto byte = std::to_integer<unsigned>(bytes[i]);
            result[2 * i] = hex_digit(byte >> 4);
            result[2 * i + 1] = hex_digit(byte);
        }
        return result;
    }

} // namespace ipcwire::encoding
