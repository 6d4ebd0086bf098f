/**
 * DropSlot - Error codes shared by the client, the server front end and the upload core.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace dropslot
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        BadRequest = 2,
        Forbidden = 3,
        NotFound = 4,
        PayloadTooLarge = 5,
        Conflict = 6,
        AuthenticationRequired = 7,
        AuthenticationFailed = 8,
        TooManyRequests = 9,
        Unsupported = 10,
        Internal = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace dropslot
