#include "ipcwire/error_codes.hpp"

#include <array>

namespace ipcwire
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::BufferUnderflow, "buffer_underflow"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::InvalidVarint, "invalid_varint"},
            {ErrorCode::InvalidText, "invalid_text"},
            {ErrorCode::MalformedFragment, "malformed_fragment"},
            {ErrorCode::MalformedToken, "malformed_token"},
            {ErrorCode::MissingSerializer, "missing_serializer"},
            {ErrorCode::MissingFragment, "missing_fragment"},
            {ErrorCode::ListenerFailed, "listener_failed"},
            {ErrorCode::InternalError, "internal_error"},
        }};

        std::string describe_first_failure(const std::vector<std::exception_ptr> &failures)
        {
            if (failures.empty())
            {
                return "no failures recorded";
            }
            try
            {
                std::rethrow_exception(failures.front());
            }
            catch (const std::exception &ex)
            {
                return ex.what();
            }
        }

        std::string dispatch_message(const std::string &endpoint, const std::vector<std::exception_ptr> &failures)
        {
            return std::to_string(failures.size()) + " listener(s) failed on endpoint '" + endpoint +
                   "', first: " + describe_first_failure(failures);
        }
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    Error::Error(ErrorCode code, const std::string &message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message),
          code_(code)
    {
    }

    DispatchError::DispatchError(const std::string &endpoint, std::vector<std::exception_ptr> failures)
        : Error(ErrorCode::ListenerFailed, dispatch_message(endpoint, failures)),
          endpoint_(endpoint),
          failures_(std::move(failures))
    {
    }

} // namespace ipcwire
