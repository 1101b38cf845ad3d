#include "ipcwire/net/header.hpp"

#include <array>
#include <cstddef>
#include <mutex>
#include <utility>

#include <sodium.h>

#include "ipcwire/encoding/text.hpp"
#include "ipcwire/error_codes.hpp"
#include "ipcwire/proto/collections.hpp"
#include "ipcwire/proto/string.hpp"

namespace ipcwire::net
{

    namespace
    {

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_sodium_init()
        {
            std::call_once(sodium_once_flag(), []()
                           {
                               if (sodium_init() < 0)
                               {
                                   throw Error(ErrorCode::InternalError, "libsodium initialization failed");
                               } });
        }

    } // namespace

    proto::SerializerPtr<FragmentHeader> header_serializer()
    {
        static const auto instance = proto::object<FragmentHeader>({
            proto::field("guid", &FragmentHeader::guid, proto::string()),
            proto::field("version", &FragmentHeader::version, proto::string()),
            proto::field("index", &FragmentHeader::index, proto::var_uint32()),
            proto::field("is_final", &FragmentHeader::is_final, proto::boolean()),
        });
        return instance;
    }

    FragmentHeader make_header(std::string guid, std::uint32_t index, bool is_final, std::string_view version)
    {
        FragmentHeader header;
        header.guid = std::move(guid);
        header.version = std::string(version);
        header.index = index;
        header.is_final = is_final;
        return header;
    }

    std::string generate_guid()
    {
        ensure_sodium_init();
        const std::uint32_t value = randombytes_random();
        std::array<std::byte, 4> bytes{};
        for (std::size_t i = 0; i < bytes.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>((value >> (8 * i)) & 0xFFu);
        }
        return encoding::to_hex(bytes);
    }

    void to_json(nlohmann::json &json, const FragmentHeader &header)
    {
        json = {
            {"guid", header.guid},
            {"version", header.version},
            {"index", header.index},
            {"final", header.is_final},
        };
    }

    void from_json(const nlohmann::json &json, FragmentHeader &header)
    {
        header.guid = json.at("guid").get<std::string>();
        header.version = json.value("version", std::string{kProtocolVersion});
        header.index = json.value("index", 0u);
        header.is_final = json.value("final", false);
    }

} // namespace ipcwire::net
