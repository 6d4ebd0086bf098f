#include "dropslot/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace dropslot::server
{

    void Session::handle_upload_start(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        try
        {
            const auto request = session_common::parse_request<dropslot::protocol::UploadStartRequest>(envelope.payload);
            const auto result = services_.uploads.start(StartRequest{
                .scope = scope_,
                .filename = request.filename,
                .content_type = request.content_type,
                .total_size = request.total_size,
                .chunk_size = request.chunk_size,
                .upload_id = request.upload_id,
            });

            dropslot::protocol::UploadStartResponse response{
                .upload_id = result.upload_id,
                .chunk_size = result.chunk_size,
                .total_chunks = result.total_chunks,
                .received_chunks = result.received_chunks,
                .resumed = result.resumed,
            };
            send_ok(response, envelope.request_id);
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("UPLOAD_START from {} failed: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_upload_chunk(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        try
        {
            const auto request = session_common::parse_request<dropslot::protocol::UploadChunkRequest>(envelope.payload);
            const auto data = session_common::decode_bytes(request.data_base64, "data");
            const auto receipt = services_.uploads.put_chunk(scope_, request.upload_id, request.index, data);

            dropslot::protocol::UploadChunkResponse response{
                .received = receipt.received_count,
                .total = receipt.total_chunks,
            };
            send_ok(response, envelope.request_id);
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("UPLOAD_CHUNK from {} failed: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_upload_complete(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        try
        {
            const auto request = session_common::parse_request<dropslot::protocol::UploadCompleteRequest>(envelope.payload);
            const auto result = services_.uploads.complete(scope_, request.upload_id);

            dropslot::protocol::UploadCompleteResponse response{
                .name = result.name,
                .size = result.size,
                .content_hash = result.content_hash,
            };
            send_ok(response, envelope.request_id);
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("UPLOAD_COMPLETE from {} failed: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

} // namespace dropslot::server
