#include "dropslot/protocol.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace dropslot::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 10> kCommandMappings{{
            {Command::Authenticate, "AUTHENTICATE"},
            {Command::UploadStart, "UPLOAD_START"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadComplete, "UPLOAD_COMPLETE"},
            {Command::SharePut, "SHARE_PUT"},
            {Command::ShareGet, "SHARE_GET"},
            {Command::ShareText, "SHARE_TEXT"},
            {Command::ShareRead, "SHARE_READ"},
            {Command::ShareClear, "SHARE_CLEAR"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        struct ShareKindMapping
        {
            ShareKind kind;
            std::string_view label;
        };

        constexpr std::array<ShareKindMapping, 3> kShareKindMappings{{
            {ShareKind::Empty, "empty"},
            {ShareKind::Text, "text"},
            {ShareKind::File, "file"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ShareKind kind) noexcept
    {
        for (const auto &mapping : kShareKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "empty";
    }

    std::optional<ShareKind> share_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kShareKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const AuthenticateRequest &request)
    {
        json = {
            {"public", request.public_mode},
            {"username", request.username},
            {"password", request.password},
            {"register", request.register_user},
        };
    }

    void from_json(const nlohmann::json &json, AuthenticateRequest &request)
    {
        request.public_mode = json.value("public", false);
        request.username = json.value("username", std::string{});
        request.password = json.value("password", std::string{});
        request.register_user = json.value("register", false);
    }

    void to_json(nlohmann::json &json, const AuthenticateResponse &response)
    {
        json = {
            {"success", response.success},
            {"newly_registered", response.newly_registered},
            {"identity", response.identity},
        };
    }

    void from_json(const nlohmann::json &json, AuthenticateResponse &response)
    {
        response.success = json.value("success", false);
        response.newly_registered = json.value("newly_registered", false);
        response.identity = json.value("identity", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadStartRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"content_type", request.content_type},
            {"size", request.total_size},
            {"chunk_size", request.chunk_size},
        };
        if (request.upload_id)
        {
            json["upload_id"] = *request.upload_id;
        }
    }

    void from_json(const nlohmann::json &json, UploadStartRequest &request)
    {
        request.filename = json.value("filename", std::string{});
        request.content_type = json.value("content_type", std::string{});
        request.total_size = json.value("size", std::int64_t{0});
        request.chunk_size = json.value("chunk_size", std::int64_t{0});
        request.upload_id = optional_string(json, "upload_id");
    }

    void to_json(nlohmann::json &json, const UploadStartResponse &response)
    {
        json = {
            {"upload_id", response.upload_id},
            {"chunk_size", response.chunk_size},
            {"total_chunks", response.total_chunks},
            {"received_chunks", response.received_chunks},
            {"resumed", response.resumed},
        };
    }

    void from_json(const nlohmann::json &json, UploadStartResponse &response)
    {
        response.upload_id = json.at("upload_id").get<std::string>();
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.received_chunks = json.value("received_chunks", std::vector<std::uint64_t>{});
        response.resumed = json.value("resumed", false);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"upload_id", request.upload_id},
            {"index", request.index},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        request.index = json.at("index").get<std::int64_t>();
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"received", response.received},
            {"total", response.total},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.received = json.value("received", 0ULL);
        response.total = json.value("total", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request)
    {
        json = {{"upload_id", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadCompleteRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadCompleteResponse &response)
    {
        json = {
            {"name", response.name},
            {"size", response.size},
            {"hash", response.content_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadCompleteResponse &response)
    {
        response.name = json.value("name", std::string{});
        response.size = json.value("size", 0ULL);
        response.content_hash = json.value("hash", std::string{});
    }

    void to_json(nlohmann::json &json, const SharePutRequest &request)
    {
        json = nlohmann::json::object();
        if (request.text)
        {
            json["text"] = *request.text;
        }
        if (request.filename)
        {
            json["filename"] = *request.filename;
        }
        if (request.data_base64)
        {
            json["data"] = *request.data_base64;
        }
    }

    void from_json(const nlohmann::json &json, SharePutRequest &request)
    {
        request.text = optional_string(json, "text");
        request.filename = optional_string(json, "filename");
        request.data_base64 = optional_string(json, "data");
    }

    void to_json(nlohmann::json &json, const ShareInfo &info)
    {
        json = {{"kind", to_string(info.kind)}};
        if (info.kind == ShareKind::Text)
        {
            json["text"] = info.text;
        }
        else if (info.kind == ShareKind::File)
        {
            json["name"] = info.name;
            json["size"] = info.size;
        }
    }

    void from_json(const nlohmann::json &json, ShareInfo &info)
    {
        const auto label = json.value("kind", std::string{"empty"});
        const auto kind = share_kind_from_string(label);
        if (!kind)
        {
            throw std::runtime_error("Unknown share kind: " + label);
        }
        info.kind = *kind;
        info.text = json.value("text", std::string{});
        info.name = json.value("name", std::string{});
        info.size = json.value("size", 0ULL);
    }

    void to_json(nlohmann::json &json, const ShareReadRequest &request)
    {
        json = {
            {"offset", request.offset},
            {"max_bytes", request.max_bytes},
        };
    }

    void from_json(const nlohmann::json &json, ShareReadRequest &request)
    {
        request.offset = json.value("offset", 0ULL);
        request.max_bytes = json.value("max_bytes", 0ULL);
    }

    void to_json(nlohmann::json &json, const ShareReadResponse &response)
    {
        json = {
            {"offset", response.offset},
            {"bytes", response.bytes},
            {"done", response.done},
            {"data", response.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, ShareReadResponse &response)
    {
        response.offset = json.value("offset", 0ULL);
        response.bytes = json.value("bytes", 0ULL);
        response.done = json.value("done", false);
        response.data_base64 = json.value("data", std::string{});
    }

} // namespace dropslot::protocol
