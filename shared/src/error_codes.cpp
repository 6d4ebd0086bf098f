#include "dropslot/error_codes.hpp"

#include <array>

namespace dropslot
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::BadRequest, "bad_request"},
            {ErrorCode::Forbidden, "forbidden"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::PayloadTooLarge, "payload_too_large"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::AuthenticationRequired, "authentication_required"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::TooManyRequests, "too_many_requests"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::Internal, "internal_error"},
        }};
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
        return ErrorCode::Internal;
    }

} // namespace dropslot
