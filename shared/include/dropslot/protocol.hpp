/**
 * DropSlot - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropslot/error_codes.hpp"

namespace dropslot::protocol
{

    enum class Command : std::uint8_t
    {
        Authenticate,
        UploadStart,
        UploadChunk,
        UploadComplete,
        SharePut,
        ShareGet,
        ShareText,
        ShareRead,
        ShareClear,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct AuthenticateRequest
    {
        bool public_mode{};
        std::string username{};
        std::string password{};
        bool register_user{};
    };

    void to_json(nlohmann::json &json, const AuthenticateRequest &request);
    void from_json(const nlohmann::json &json, AuthenticateRequest &request);

    struct AuthenticateResponse
    {
        bool success{};
        bool newly_registered{};
        std::string identity{};
    };

    void to_json(nlohmann::json &json, const AuthenticateResponse &response);
    void from_json(const nlohmann::json &json, AuthenticateResponse &response);

    // Sizes and indices are signed on the wire so that negative values reach validation
    // instead of wrapping around.
    struct UploadStartRequest
    {
        std::string filename;
        std::string content_type;
        std::int64_t total_size{};
        std::int64_t chunk_size{};
        std::optional<std::string> upload_id{};
    };

    void to_json(nlohmann::json &json, const UploadStartRequest &request);
    void from_json(const nlohmann::json &json, UploadStartRequest &request);

    struct UploadStartResponse
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::vector<std::uint64_t> received_chunks;
        bool resumed{};
    };

    void to_json(nlohmann::json &json, const UploadStartResponse &response);
    void from_json(const nlohmann::json &json, UploadStartResponse &response);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::int64_t index{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::uint64_t received{};
        std::uint64_t total{};
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    struct UploadCompleteRequest
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request);
    void from_json(const nlohmann::json &json, UploadCompleteRequest &request);

    struct UploadCompleteResponse
    {
        std::string name;
        std::uint64_t size{};
        std::string content_hash;
    };

    void to_json(nlohmann::json &json, const UploadCompleteResponse &response);
    void from_json(const nlohmann::json &json, UploadCompleteResponse &response);

    /// Either @c text or @c filename + @c data_base64 must be present.
    struct SharePutRequest
    {
        std::optional<std::string> text{};
        std::optional<std::string> filename{};
        std::optional<std::string> data_base64{};
    };

    void to_json(nlohmann::json &json, const SharePutRequest &request);
    void from_json(const nlohmann::json &json, SharePutRequest &request);

    enum class ShareKind : std::uint8_t
    {
        Empty,
        Text,
        File
    };

    std::string_view to_string(ShareKind kind) noexcept;
    std::optional<ShareKind> share_kind_from_string(std::string_view value) noexcept;

    struct ShareInfo
    {
        ShareKind kind{ShareKind::Empty};
        std::string text;
        std::string name;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const ShareInfo &info);
    void from_json(const nlohmann::json &json, ShareInfo &info);

    struct ShareReadRequest
    {
        std::uint64_t offset{};
        std::uint64_t max_bytes{};
    };

    void to_json(nlohmann::json &json, const ShareReadRequest &request);
    void from_json(const nlohmann::json &json, ShareReadRequest &request);

    struct ShareReadResponse
    {
        std::uint64_t offset{};
        std::uint64_t bytes{};
        bool done{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const ShareReadResponse &response);
    void from_json(const nlohmann::json &json, ShareReadResponse &response);

} // namespace dropslot::protocol
