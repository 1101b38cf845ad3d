/**
 * ipcwire - Error codes and exception types shared by every layer.
 */
#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ipcwire
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        BufferUnderflow = 1,
        InvalidArgument = 2,
        InvalidVarint = 3,
        InvalidText = 4,
        MalformedFragment = 5,
        MalformedToken = 6,
        MissingSerializer = 7,
        MissingFragment = 8,
        ListenerFailed = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    /// Raised after every listener of one dispatch has run and at least one threw.
    class DispatchError : public Error
    {
    public:
        DispatchError(const std::string &endpoint, std::vector<std::exception_ptr> failures);

        const std::string &endpoint() const noexcept { return endpoint_; }
        const std::vector<std::exception_ptr> &failures() const noexcept { return failures_; }

    private:
        std::string endpoint_;
        std::vector<std::exception_ptr> failures_;
    };

} // namespace ipcwire
