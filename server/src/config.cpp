#include "dropslot/server/config.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace dropslot::server
{

    namespace
    {

        std::string read_option(int &index, int argc, char *argv[])
        {
            const std::string flag = argv[index];
            if (index + 1 >= argc)
            {
                throw std::invalid_argument("Missing value for " + flag);
            }
            ++index;
            return std::string(argv[index]);
        }

        std::uint64_t parse_unsigned(const std::string &flag, const std::string &value)
        {
            if (value.empty() || value.front() == '-' || value.front() == '+')
            {
                throw std::invalid_argument("Invalid value for " + flag + ": " + value);
            }
            std::size_t consumed = 0;
            std::uint64_t result = 0;
            try
            {
                result = std::stoull(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::invalid_argument("Invalid value for " + flag + ": " + value);
            }
            if (consumed != value.size())
            {
                throw std::invalid_argument("Invalid value for " + flag + ": " + value);
            }
            return result;
        }

        std::chrono::seconds parse_seconds(const std::string &flag, const std::string &value)
        {
            const auto seconds = parse_unsigned(flag, value);
            if (seconds > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            {
                throw std::invalid_argument("Value out of range for " + flag + ": " + value);
            }
            return std::chrono::seconds{static_cast<std::int64_t>(seconds)};
        }

    } // namespace

    ServerConfig parse_server_arguments(int argc, char *argv[])
    {
        ServerConfig config;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--port")
            {
                const auto value = read_option(i, argc, argv);
                const auto port = parse_unsigned(arg, value);
                if (port == 0 || port > std::numeric_limits<std::uint16_t>::max())
                {
                    throw std::invalid_argument("Port out of range: " + value);
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(read_option(i, argc, argv));
            }
            else if (arg == "--address")
            {
                config.address = read_option(i, argc, argv);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_unsigned(arg, read_option(i, argc, argv)));
            }
            else if (arg == "--public-max-upload")
            {
                config.uploads.public_max_bytes = parse_unsigned(arg, read_option(i, argc, argv));
            }
            else if (arg == "--user-max-upload")
            {
                config.uploads.user_max_bytes = parse_unsigned(arg, read_option(i, argc, argv));
            }
            else if (arg == "--chunk-size")
            {
                config.uploads.default_chunk_size = parse_unsigned(arg, read_option(i, argc, argv));
            }
            else if (arg == "--max-chunk-size")
            {
                config.uploads.max_chunk_size = parse_unsigned(arg, read_option(i, argc, argv));
            }
            else if (arg == "--session-ttl")
            {
                config.uploads.session_ttl = parse_seconds(arg, read_option(i, argc, argv));
            }
            else if (arg == "--public-ttl")
            {
                config.slots.public_ttl = parse_seconds(arg, read_option(i, argc, argv));
            }
            else if (arg == "--user-ttl")
            {
                config.slots.user_ttl = parse_seconds(arg, read_option(i, argc, argv));
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = parse_seconds(arg, read_option(i, argc, argv));
            }
            else if (arg == "--public-rate-limit")
            {
                config.public_rate_limit.limit = static_cast<std::size_t>(parse_unsigned(arg, read_option(i, argc, argv)));
            }
            else if (arg == "--rate-window")
            {
                config.public_rate_limit.window = parse_seconds(arg, read_option(i, argc, argv));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(read_option(i, argc, argv));
            }
            else
            {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }

        if (config.port == 0)
        {
            throw std::invalid_argument("--port is required");
        }
        if (config.root.empty())
        {
            throw std::invalid_argument("--root is required");
        }
        if (config.uploads.default_chunk_size == 0)
        {
            throw std::invalid_argument("--chunk-size must be positive");
        }
        if (config.uploads.max_chunk_size < config.uploads.default_chunk_size)
        {
            throw std::invalid_argument("--max-chunk-size must not be below --chunk-size");
        }
        return config;
    }

    std::string server_usage(const std::string &program_name)
    {
        std::ostringstream oss;
        oss << "Usage: " << program_name << " --port <PORT> --root <ROOT> [options]\n"
            << "Options:\n"
            << "  --address <ADDRESS>          listen address (default 0.0.0.0)\n"
            << "  --threads <N>                worker threads (default: hardware concurrency)\n"
            << "  --public-max-upload <BYTES>  largest anonymous upload (default 10 MiB)\n"
            << "  --user-max-upload <BYTES>    largest user upload (default 10 MiB)\n"
            << "  --chunk-size <BYTES>         chunk size offered to clients (default 1 MiB)\n"
            << "  --max-chunk-size <BYTES>     largest accepted chunk size (default 16 MiB)\n"
            << "  --session-ttl <SECONDS>      idle upload lifetime, 0 keeps forever (default 86400)\n"
            << "  --public-ttl <SECONDS>       public slot lifetime, 0 keeps forever (default 86400)\n"
            << "  --user-ttl <SECONDS>         user slot lifetime, 0 keeps forever (default 2592000)\n"
            << "  --sweep-interval <SECONDS>   period of the upload sweep, 0 disables (default 600)\n"
            << "  --public-rate-limit <N>      anonymous writes per window, 0 disables (default 100)\n"
            << "  --rate-window <SECONDS>      rate limit window (default 600)\n"
            << "  --log <FILE>                 also log to FILE\n"
            << "  --verbose                    debug logging\n";
        return oss.str();
    }

} // namespace dropslot::server
