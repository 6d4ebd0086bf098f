#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dropslot::client
{

    struct ClientConfig
    {
        std::optional<std::string> username;
        std::string host;
        std::uint16_t port{};
        std::optional<std::filesystem::path> log_path;
        std::optional<std::uint64_t> chunk_size;
        std::string command;
        std::vector<std::string> args;
    };

    /// Parses `[user@]host:port [--log FILE] [--chunk-size BYTES] <command> [args...]`.
    /// Throws std::runtime_error with a usage hint on malformed input.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const std::string &program_name);

} // namespace dropslot::client
