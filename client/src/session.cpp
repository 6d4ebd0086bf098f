#include "dropslot/client/session.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "dropslot/error_codes.hpp"
#include "dropslot/framing.hpp"
#include "dropslot/protocol.hpp"

namespace dropslot::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          state_store_(),
          socket_(io_context_) {}

    int ClientSession::run()
    {
        try
        {
            connect();
            authenticate();
            return execute() ? 0 : 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.error("session", "fatal: ", ex.what());
            return 1;
        }
    }

    void ClientSession::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.info("session", "connected to ", config_.host, ':', config_.port);
    }

    std::string ClientSession::prompt_password(const std::string &username)
    {
        std::string password;
        std::cout << "Password for " << username << ": " << std::flush;
        std::getline(std::cin, password);
        return password;
    }

    bool ClientSession::ask_yes_no(const std::string &question) const
    {
        while (true)
        {
            std::cout << question << " (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return false;
            }
            answer = trim(to_upper(answer));
            if (answer == "Y" || answer == "YES")
            {
                return true;
            }
            if (answer == "N" || answer == "NO")
            {
                return false;
            }
            std::cout << "Please answer y or n." << std::endl;
        }
    }

    void ClientSession::authenticate()
    {
        dropslot::protocol::AuthenticateRequest request{};
        request.public_mode = !config_.username.has_value();
        request.username = config_.username.value_or("");

        if (request.public_mode)
        {
            std::cout << "[warning] public mode - the shared item is visible to everyone" << std::endl;
        }
        else
        {
            request.password = prompt_password(request.username);
        }

        for (;;)
        {
            auto response = rpc(dropslot::protocol::Command::Authenticate, request);
            if (response.kind == dropslot::protocol::ResponseKind::Ok)
            {
                const auto auth = response.payload.get<dropslot::protocol::AuthenticateResponse>();
                identity_ = auth.identity;
                logger_.info("session", "authenticated as ", identity_);
                return;
            }

            if (request.public_mode || request.register_user)
            {
                throw std::runtime_error("Authentication failed: " + response.message);
            }

            std::cout << "Authentication failed: " << response.message << std::endl;
            if (!ask_yes_no("User " + request.username + " not found. Register?"))
            {
                throw std::runtime_error("Unable to authenticate user");
            }
            request.register_user = true;
            request.password = prompt_password(request.username);
        }
    }

    bool ClientSession::execute()
    {
        logger_.info("command", config_.command, " (", config_.args.size(), " argument(s))");
        if (config_.command == "upload")
        {
            return handle_upload(std::filesystem::path(config_.args.at(0)));
        }
        if (config_.command == "get")
        {
            return handle_get(std::filesystem::path(config_.args.at(0)));
        }
        if (config_.command == "text")
        {
            return handle_text(config_.args.at(0));
        }
        if (config_.command == "show")
        {
            return handle_show();
        }
        if (config_.command == "clear")
        {
            return handle_clear();
        }
        std::cout << "ERROR: unsupported_command" << std::endl;
        return false;
    }

    std::string ClientSession::state_key() const
    {
        return identity_ + "@" + config_.host + ":" + std::to_string(config_.port);
    }

    void ClientSession::print_error(const dropslot::protocol::ResponseEnvelope &response) const
    {
        std::cout << "ERROR: " << dropslot::to_string(response.error) << std::endl;
        if (!response.message.empty())
        {
            std::cout << response.message << std::endl;
        }
    }

    dropslot::protocol::ResponseEnvelope ClientSession::rpc(dropslot::protocol::Command command,
                                                            const nlohmann::json &payload)
    {
        dropslot::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = dropslot::protocol::encode_frame(nlohmann::json(envelope));
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, dropslot::protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = dropslot::protocol::decode_frame_length(header);
        if (size > dropslot::protocol::kMaxFrameSize)
        {
            throw std::runtime_error("Server sent an oversized frame");
        }
        std::vector<char> buffer(size);
        asio::read(socket_, asio::buffer(buffer.data(), buffer.size()));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(buffer.begin(), buffer.end());
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.error("rpc", "parse error size=", size, " msg=", ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        auto response = json_response.get<dropslot::protocol::ResponseEnvelope>();
        if (response.kind == dropslot::protocol::ResponseKind::Error)
        {
            logger_.warn("rpc", "error=", dropslot::to_string(response.error), " msg=", response.message);
        }
        else
        {
            logger_.info("rpc", "ok cmd=", dropslot::protocol::to_string(command));
        }
        return response;
    }

    std::string ClientSession::next_request_id()
    {
        std::ostringstream oss;
        oss << "req-" << (++request_counter_);
        return oss.str();
    }

} // namespace dropslot::client
