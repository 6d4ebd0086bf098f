/**
 * DropSlot - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace dropslot::crypto
{

    void ensure_sodium_init();

    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    /// Hex encoded string of @p byte_count random bytes, used for session ids and blob names.
    std::string random_token(std::size_t byte_count);

} // namespace dropslot::crypto
