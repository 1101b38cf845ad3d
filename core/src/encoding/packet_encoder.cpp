#include "ipcwire/encoding/packet_encoder.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include "ipcwire/encoding/text.hpp"
#include "ipcwire/error_codes.hpp"

namespace ipcwire::encoding
{

    namespace
    {
        std::string fragment_position(std::size_t fragment, std::size_t pos)
        {
            return "fragment " + std::to_string(fragment) + ", byte " + std::to_string(pos);
        }

        int checked_hex(std::string_view text, std::size_t pos, std::size_t fragment)
        {
            const int value = hex_value(text[pos]);
            if (value < 0)
            {
                throw Error(ErrorCode::MalformedFragment, "non-hex character at " + fragment_position(fragment, pos));
            }
            return value;
        }
    } // namespace

    std::size_t unit_cost(char16_t unit) noexcept
    {
        return unit <= 0xFF ? 2 : code_unit_width(unit);
    }

    Job<std::vector<std::string>> encode_packets(const ByteBuffer &buffer, std::size_t max_size)
    {
        const auto bytes = buffer.view();
        std::vector<std::string> fragments;
        std::string current;

        for (std::size_t i = 0; i < bytes.size(); i += 2)
        {
            const auto low = std::to_integer<std::uint16_t>(bytes[i]);
            const bool padded = i + 1 >= bytes.size();
            const auto high = padded ? std::uint16_t{0} : std::to_integer<std::uint16_t>(bytes[i + 1]);
            const auto unit = static_cast<char16_t>(low | (high << 8));
            const auto cost = unit_cost(unit) + (padded ? 1 : 0);
            if (cost > max_size)
            {
                throw Error(ErrorCode::InvalidArgument, "unit at byte " + std::to_string(i) + " costs " +
                                                            std::to_string(cost) + ", over the fragment budget of " +
                                                            std::to_string(max_size));
            }

            if (current.size() + cost > max_size)
            {
                fragments.push_back(std::move(current));
                current.clear();
            }

            if (unit <= 0xFF)
            {
                current.push_back(hex_digit(unit >> 4));
                current.push_back(hex_digit(unit));
                if (padded)
                {
                    current.push_back(kPadMarker);
                }
            }
            else
            {
                append_code_unit(current, unit);
            }
            co_yield checkpoint;
        }

        if (!current.empty() || fragments.empty())
        {
            fragments.push_back(std::move(current));
        }
        co_return fragments;
    }

    Job<ByteBuffer> decode_packets(std::vector<std::string> fragments)
    {
        ByteBuffer buffer;
        for (std::size_t f = 0; f < fragments.size(); ++f)
        {
            const std::string_view text = fragments[f];
            const bool last_fragment = f + 1 == fragments.size();
            std::size_t pos = 0;
            while (pos < text.size())
            {
                const auto lead = static_cast<unsigned char>(text[pos]);
                if (lead < 0x80)
                {
                    if (pos + 1 >= text.size())
                    {
                        throw Error(ErrorCode::MalformedFragment, "truncated hex pair at " + fragment_position(f, pos));
                    }
                    const int value = (checked_hex(text, pos, f) << 4) | checked_hex(text, pos + 1, f);
                    pos += 2;
                    buffer.write_byte(static_cast<std::uint8_t>(value));

                    if (pos < text.size() && text[pos] == kPadMarker)
                    {
                        if (!last_fragment || pos + 1 != text.size())
                        {
                            throw Error(ErrorCode::MalformedFragment,
                                        "pad marker before the end of the message at " + fragment_position(f, pos));
                        }
                        ++pos;
                    }
                    else
                    {
                        buffer.write_byte(0);
                    }
                }
                else
                {
                    const auto at = pos;
                    const char16_t unit = next_code_unit(text, pos);
                    if (unit <= 0xFF)
                    {
                        throw Error(ErrorCode::MalformedFragment,
                                    "raw character below 0x100 at " + fragment_position(f, at));
                    }
                    buffer.write_byte(static_cast<std::uint8_t>(unit & 0xFF));
                    buffer.write_byte(static_cast<std::uint8_t>(unit >> 8));
                }
                co_yield checkpoint;
            }
        }
        buffer.reset_read();
        co_return buffer;
    }

} // namespace ipcwire::encoding
