/**
 * ipcwire - Fragment header schema and message identifiers.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "ipcwire/proto/serializer.hpp"

namespace ipcwire::net
{

    /// Tag understood by existing peers; receivers compare it verbatim.
    inline constexpr std::string_view kProtocolVersion = "mcbe-ipc:v3";

    inline constexpr std::size_t kGuidLength = 8;

    /// Wire order: guid, version, index (varuint32), is_final (bool).
    struct FragmentHeader
    {
        std::string guid;
        std::string version{kProtocolVersion};
        std::uint32_t index{0};
        bool is_final{false};

        bool operator==(const FragmentHeader &) const = default;
    };

    proto::SerializerPtr<FragmentHeader> header_serializer();

    FragmentHeader make_header(std::string guid, std::uint32_t index, bool is_final,
                               std::string_view version = kProtocolVersion);

    /// 32 random bits from libsodium as 8 uppercase hex characters, low byte first.
    /// Not globally unique.
    std::string generate_guid();

    void to_json(nlohmann::json &json, const FragmentHeader &header);
    void from_json(const nlohmann::json &json, FragmentHeader &header);

} // namespace ipcwire::net
