#include "session_common.hpp"

#include "dropslot/encoding/base64.hpp"

namespace dropslot::server::session_common
{

    std::vector<std::byte> decode_bytes(const std::string &data_base64, std::string_view field)
    {
        auto decoded = dropslot::encoding::decode_base64(data_base64);
        if (!decoded)
        {
            throw ServiceError(dropslot::ErrorCode::BadRequest, "Field '" + std::string(field) + "' is not valid base64");
        }
        return std::move(*decoded);
    }

} // namespace dropslot::server::session_common
