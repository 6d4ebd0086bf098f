#include "dropslot/server/session.hpp"

#include <algorithm>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dropslot/encoding/base64.hpp"
#include "session_common.hpp"

namespace dropslot::server
{

    namespace
    {
        constexpr std::uint64_t kDefaultReadSize = 1ULL * 1024 * 1024;
        constexpr std::uint64_t kMaxReadSize = 8ULL * 1024 * 1024;

        dropslot::protocol::ShareInfo describe_artifact(const Artifact &artifact)
        {
            dropslot::protocol::ShareInfo info{};
            switch (artifact.kind)
            {
            case ArtifactKind::File:
                info.kind = dropslot::protocol::ShareKind::File;
                info.name = artifact.name;
                info.size = artifact.size;
                break;
            case ArtifactKind::Text:
                info.kind = dropslot::protocol::ShareKind::Text;
                info.text = artifact.text;
                break;
            case ArtifactKind::None:
                break;
            }
            return info;
        }
    } // namespace

    void Session::handle_share_put(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope) || !allow_public_write(envelope))
        {
            return;
        }
        try
        {
            const auto request = session_common::parse_request<dropslot::protocol::SharePutRequest>(envelope.payload);
            const auto &limits = services_.uploads.limits();
            const auto max_bytes = scope_.is_public() ? limits.public_max_bytes : limits.user_max_bytes;

            if (request.text && !request.filename && !request.data_base64)
            {
                if (request.text->size() > max_bytes)
                {
                    send_error(dropslot::ErrorCode::PayloadTooLarge, "Text too large", envelope.request_id);
                    return;
                }
                services_.slots.set_text(scope_, *request.text);
            }
            else if (!request.text && request.filename && request.data_base64)
            {
                const auto data = session_common::decode_bytes(*request.data_base64, "data");
                if (data.size() > max_bytes)
                {
                    send_error(dropslot::ErrorCode::PayloadTooLarge,
                               "File exceeds the limit of " + std::to_string(max_bytes) + " bytes", envelope.request_id);
                    return;
                }
                services_.slots.set_file_bytes(scope_, *request.filename, data);
            }
            else
            {
                send_error(dropslot::ErrorCode::BadRequest, "Provide either text or filename and data",
                           envelope.request_id);
                return;
            }
            send_ok(nlohmann::json::object(), envelope.request_id);
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("SHARE_PUT from {} failed: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_share_get(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        try
        {
            send_ok(describe_artifact(services_.slots.read(scope_)), envelope.request_id);
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("SHARE_GET from {} failed: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_share_text(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        try
        {
            const auto artifact = services_.slots.read(scope_);
            nlohmann::json payload;
            payload["text"] = artifact.kind == ArtifactKind::Text ? artifact.text : std::string{};
            send_ok(std::move(payload), envelope.request_id);
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("SHARE_TEXT from {} failed: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_share_read(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        try
        {
            const auto request = session_common::parse_request<dropslot::protocol::ShareReadRequest>(envelope.payload);
            auto opened = services_.slots.open_file(scope_);
            const auto size = opened.artifact.size;
            if (request.offset > size)
            {
                send_error(dropslot::ErrorCode::BadRequest, "Offset beyond end of file", envelope.request_id);
                return;
            }

            const auto wanted = request.max_bytes == 0 ? kDefaultReadSize : std::min(request.max_bytes, kMaxReadSize);
            const auto length = std::min<std::uint64_t>(wanted, size - request.offset);

            std::vector<std::byte> data(static_cast<std::size_t>(length));
            opened.stream.seekg(static_cast<std::streamoff>(request.offset));
            opened.stream.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
            if (static_cast<std::uint64_t>(opened.stream.gcount()) != length)
            {
                throw ServiceError(dropslot::ErrorCode::Internal, "Short read from shared file");
            }

            dropslot::protocol::ShareReadResponse response{
                .offset = request.offset,
                .bytes = length,
                .done = request.offset + length >= size,
                .data_base64 = dropslot::encoding::encode_base64(data),
            };
            send_ok(response, envelope.request_id);
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("SHARE_READ from {} failed: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_share_clear(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope) || !allow_public_write(envelope))
        {
            return;
        }
        try
        {
            services_.slots.clear(scope_);
            send_ok(nlohmann::json::object(), envelope.request_id);
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("SHARE_CLEAR from {} failed: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

} // namespace dropslot::server
