#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dropslot::server
{

    struct UploadLimits
    {
        std::uint64_t public_max_bytes{10ULL * 1024 * 1024};
        std::uint64_t user_max_bytes{10ULL * 1024 * 1024};
        std::uint64_t default_chunk_size{1ULL * 1024 * 1024};
        std::uint64_t max_chunk_size{16ULL * 1024 * 1024};
        // Upload sessions untouched for longer are swept. Zero disables expiry.
        std::chrono::seconds session_ttl{std::chrono::hours{24}};
    };

    struct SlotPolicy
    {
        std::chrono::seconds public_ttl{std::chrono::hours{24}};
        std::chrono::seconds user_ttl{std::chrono::hours{24 * 30}};
    };

    struct RateLimitPolicy
    {
        std::size_t limit{100};
        std::chrono::seconds window{std::chrono::minutes{10}};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
        bool show_help{false};
        UploadLimits uploads{};
        SlotPolicy slots{};
        RateLimitPolicy public_rate_limit{};
        std::chrono::seconds sweep_interval{std::chrono::minutes{10}};
    };

    /// Parses server command-line flags. Throws std::invalid_argument on unknown flags,
    /// missing values or malformed numbers.
    ServerConfig parse_server_arguments(int argc, char *argv[]);

    std::string server_usage(const std::string &program_name);

} // namespace dropslot::server
