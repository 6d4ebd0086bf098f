#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "dropslot/error_codes.hpp"

namespace dropslot::server
{

    /// Error raised by the upload core and its collaborators; the session layer maps it onto
    /// an error response carrying the same code.
    class ServiceError : public std::runtime_error
    {
    public:
        ServiceError(dropslot::ErrorCode code, std::string message);
        ServiceError(dropslot::ErrorCode code, std::string message, std::vector<std::uint64_t> missing_chunks);

        dropslot::ErrorCode code() const noexcept { return code_; }

        /// Ascending chunk indices still expected by an incomplete upload; empty otherwise.
        const std::vector<std::uint64_t> &missing_chunks() const noexcept { return missing_chunks_; }

    private:
        dropslot::ErrorCode code_;
        std::vector<std::uint64_t> missing_chunks_;
    };

} // namespace dropslot::server
