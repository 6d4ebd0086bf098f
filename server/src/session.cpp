#include "dropslot/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <span>
#include <string>

#include <spdlog/spdlog.h>

namespace dropslot::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const auto payload_size = dropslot::protocol::decode_frame_length(
                                 std::span<const std::uint8_t, dropslot::protocol::kFrameHeaderSize>(header_buffer_));
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > dropslot::protocol::kMaxFrameSize)
                             {
                                 spdlog::warn("{} sent a frame of {} bytes, closing", remote_endpoint(), payload_size);
                                 close_after_write_ = true;
                                 send_error(dropslot::ErrorCode::PayloadTooLarge, "Frame too large");
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(dropslot::ErrorCode::BadRequest, ex.what());
                                 return;
                             }
                             buffer_.clear();
                             process_message(json);
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        dropslot::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<dropslot::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(dropslot::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), dropslot::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case dropslot::protocol::Command::Authenticate:
            handle_authenticate(envelope);
            break;
        case dropslot::protocol::Command::UploadStart:
            handle_upload_start(envelope);
            break;
        case dropslot::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case dropslot::protocol::Command::UploadComplete:
            handle_upload_complete(envelope);
            break;
        case dropslot::protocol::Command::SharePut:
            handle_share_put(envelope);
            break;
        case dropslot::protocol::Command::ShareGet:
            handle_share_get(envelope);
            break;
        case dropslot::protocol::Command::ShareText:
            handle_share_text(envelope);
            break;
        case dropslot::protocol::Command::ShareRead:
            handle_share_read(envelope);
            break;
        case dropslot::protocol::Command::ShareClear:
            handle_share_clear(envelope);
            break;
        case dropslot::protocol::Command::Ping:
            send_ok(nlohmann::json::object(), envelope.request_id);
            break;
        default:
            send_error(dropslot::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    // Exactly one response is written per request; the next frame is read once it is out.
    void Session::send_response(const dropslot::protocol::ResponseEnvelope &envelope)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(dropslot::protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            dropslot::protocol::ResponseEnvelope fallback;
            fallback.kind = dropslot::protocol::ResponseKind::Error;
            fallback.error = dropslot::ErrorCode::Internal;
            fallback.message = "Failed to encode response";
            fallback.request_id = envelope.request_id;
            frame = std::make_shared<std::vector<std::uint8_t>>(dropslot::protocol::encode_frame(nlohmann::json(fallback)));
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec || close_after_write_)
                              {
                                  stop();
                                  return;
                              }
                              read_frame_header();
                          });
    }

    void Session::send_ok(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        dropslot::protocol::ResponseEnvelope envelope;
        envelope.kind = dropslot::protocol::ResponseKind::Ok;
        envelope.error = dropslot::ErrorCode::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        send_response(envelope);
    }

    void Session::send_error(dropslot::ErrorCode code, std::string message, std::optional<std::string> request_id,
                             nlohmann::json payload)
    {
        dropslot::protocol::ResponseEnvelope envelope;
        envelope.kind = dropslot::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.payload = std::move(payload);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Session::send_service_error(const ServiceError &error, const std::optional<std::string> &request_id)
    {
        nlohmann::json payload = nlohmann::json::object();
        if (error.code() == dropslot::ErrorCode::Conflict && !error.missing_chunks().empty())
        {
            payload["missing_chunks"] = error.missing_chunks();
        }
        if (error.code() == dropslot::ErrorCode::Internal)
        {
            spdlog::error("{}: {}", remote_endpoint(), error.what());
        }
        else
        {
            spdlog::debug("{}: {} ({})", remote_endpoint(), error.what(), dropslot::to_string(error.code()));
        }
        send_error(error.code(), error.what(), request_id, std::move(payload));
    }

    bool Session::require_authenticated(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!authenticated_)
        {
            send_error(dropslot::ErrorCode::AuthenticationRequired, "Authentication required", envelope.request_id);
            return false;
        }
        return true;
    }

    bool Session::allow_public_write(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!scope_.is_public())
        {
            return true;
        }
        const auto action = dropslot::protocol::to_string(envelope.command);
        if (services_.public_rate_limiter.try_acquire(RateLimiter::key_for(action, remote_address())))
        {
            return true;
        }
        spdlog::warn("Rate limit exceeded for {} by {}", action, remote_address());
        send_error(dropslot::ErrorCode::TooManyRequests, "Too many requests, try again later", envelope.request_id);
        return false;
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    std::string Session::remote_address() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string();
    }

} // namespace dropslot::server
