#include "dropslot/client/config.hpp"

#include <array>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dropslot::client
{

    namespace
    {

        struct CommandArity
        {
            std::string_view name;
            std::size_t args;
        };

        constexpr std::array<CommandArity, 5> kCommands{{
            {"upload", 1},
            {"text", 1},
            {"show", 0},
            {"get", 1},
            {"clear", 0},
        }};

        std::uint64_t parse_number(const std::string &flag, const std::string &value)
        {
            std::size_t consumed = 0;
            std::uint64_t result = 0;
            try
            {
                result = std::stoull(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("Invalid value for " + flag + ": " + value);
            }
            if (consumed != value.size() || value.front() == '-')
            {
                throw std::runtime_error("Invalid value for " + flag + ": " + value);
            }
            return result;
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(usage(argc > 0 ? argv[0] : "dropslot_client"));
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto at_pos = endpoint.find('@');
        std::string host_part = endpoint;
        if (at_pos != std::string::npos)
        {
            config.username = endpoint.substr(0, at_pos);
            host_part = endpoint.substr(at_pos + 1);
            if (config.username->empty())
            {
                throw std::runtime_error("Empty username in endpoint");
            }
        }

        const auto colon_pos = host_part.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = host_part.substr(0, colon_pos);
        const auto port = parse_number("port", host_part.substr(colon_pos + 1));
        if (port == 0 || port > 65535)
        {
            throw std::runtime_error("Port out of range: " + host_part.substr(colon_pos + 1));
        }
        config.port = static_cast<std::uint16_t>(port);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--chunk-size requires a value (bytes)");
                }
                config.chunk_size = parse_number(arg, argv[index++]);
                if (*config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (config.command.empty())
            {
                config.command = arg;
            }
            else
            {
                config.args.push_back(arg);
            }
        }

        if (config.command.empty())
        {
            throw std::runtime_error("Missing command\n" + usage(argv[0]));
        }
        for (const auto &entry : kCommands)
        {
            if (entry.name == config.command)
            {
                if (config.args.size() != entry.args)
                {
                    throw std::runtime_error("Command '" + config.command + "' expects " + std::to_string(entry.args) +
                                             " argument(s)");
                }
                return config;
            }
        }
        throw std::runtime_error("Unknown command: " + config.command + "\n" + usage(argv[0]));
    }

    std::string usage(const std::string &program_name)
    {
        std::ostringstream oss;
        oss << "Usage: " << program_name << " [username@]<server>:<port> [--log <file>] [--chunk-size <bytes>] <command>\n"
            << "Commands:\n"
            << "  upload <file>       share a file, resuming an interrupted upload\n"
            << "  text <string>       share a text snippet\n"
            << "  show                describe the shared item\n"
            << "  get <out-file>      download the shared file\n"
            << "  clear               remove the shared item\n";
        return oss.str();
    }

} // namespace dropslot::client
