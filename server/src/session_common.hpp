#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropslot/server/service_error.hpp"

namespace dropslot::server::session_common
{

    /// Decodes a base64 field of a request; malformed input raises ServiceError(BadRequest).
    std::vector<std::byte> decode_bytes(const std::string &data_base64, std::string_view field);

    template <typename Request>
    Request parse_request(const nlohmann::json &payload)
    {
        try
        {
            return payload.get<Request>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ServiceError(dropslot::ErrorCode::BadRequest, std::string{"Malformed request: "} + ex.what());
        }
    }

} // namespace dropslot::server::session_common
