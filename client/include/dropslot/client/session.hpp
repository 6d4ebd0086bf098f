#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropslot/client/config.hpp"
#include "dropslot/client/logger.hpp"
#include "dropslot/client/upload_state_store.hpp"
#include "dropslot/protocol.hpp"

namespace dropslot::client
{

    /// One connection to the server running a single command from the command line.
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        /// Returns the process exit code.
        int run();

    private:
        void connect();
        static std::string prompt_password(const std::string &username);
        bool ask_yes_no(const std::string &question) const;
        void authenticate();
        bool execute();

        bool handle_upload(const std::filesystem::path &local_path);
        bool handle_get(const std::filesystem::path &local_target);
        bool handle_text(const std::string &text);
        bool handle_show();
        bool handle_clear();

        bool send_chunks(std::ifstream &input, const std::string &upload_id, std::uint64_t chunk_size,
                         std::uint64_t total_size, const std::vector<std::uint64_t> &indices);

        std::string state_key() const;

        dropslot::protocol::ResponseEnvelope rpc(dropslot::protocol::Command command,
                                                 const nlohmann::json &payload = nlohmann::json::object());
        void print_error(const dropslot::protocol::ResponseEnvelope &response) const;
        std::string next_request_id();

        ClientConfig config_;
        Logger logger_;
        UploadStateStore state_store_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::string identity_;
        std::uint64_t request_counter_{0};
    };

} // namespace dropslot::client
