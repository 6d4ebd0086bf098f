#include "dropslot/server/service_error.hpp"

#include <utility>

namespace dropslot::server
{

    ServiceError::ServiceError(dropslot::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    ServiceError::ServiceError(dropslot::ErrorCode code, std::string message,
                               std::vector<std::uint64_t> missing_chunks)
        : std::runtime_error(std::move(message)), code_(code), missing_chunks_(std::move(missing_chunks)) {}

} // namespace dropslot::server
