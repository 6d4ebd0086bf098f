#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropslot/error_codes.hpp"
#include "dropslot/framing.hpp"
#include "dropslot/protocol.hpp"
#include "dropslot/server/blob_store.hpp"
#include "dropslot/server/owner_scope.hpp"
#include "dropslot/server/rate_limiter.hpp"
#include "dropslot/server/service_error.hpp"
#include "dropslot/server/share_slot_manager.hpp"
#include "dropslot/server/upload_coordinator.hpp"
#include "dropslot/server/user_store.hpp"

namespace dropslot::server
{

    struct ServerServices
    {
        UserStore &user_store;
        UploadCoordinator &uploads;
        ShareSlotManager &slots;
        RateLimiter &public_rate_limiter;
    };

    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const dropslot::protocol::ResponseEnvelope &envelope);
        void send_ok(nlohmann::json payload, const std::optional<std::string> &request_id);
        void send_error(dropslot::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt,
                        nlohmann::json payload = nlohmann::json::object());
        void send_service_error(const ServiceError &error, const std::optional<std::string> &request_id);
        bool require_authenticated(const dropslot::protocol::RequestEnvelope &envelope);
        bool allow_public_write(const dropslot::protocol::RequestEnvelope &envelope);

        void handle_authenticate(const dropslot::protocol::RequestEnvelope &envelope);
        void handle_upload_start(const dropslot::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const dropslot::protocol::RequestEnvelope &envelope);
        void handle_upload_complete(const dropslot::protocol::RequestEnvelope &envelope);
        void handle_share_put(const dropslot::protocol::RequestEnvelope &envelope);
        void handle_share_get(const dropslot::protocol::RequestEnvelope &envelope);
        void handle_share_text(const dropslot::protocol::RequestEnvelope &envelope);
        void handle_share_read(const dropslot::protocol::RequestEnvelope &envelope);
        void handle_share_clear(const dropslot::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;
        std::string remote_address() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, dropslot::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool authenticated_{false};
        bool stopped_{false};
        // set when the peer violated framing; the connection closes once the error is written
        bool close_after_write_{false};
        OwnerScope scope_{};
    };

} // namespace dropslot::server
