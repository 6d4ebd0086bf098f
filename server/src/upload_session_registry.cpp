#include "dropslot/server/upload_session_registry.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dropslot/crypto.hpp"
#include "dropslot/server/service_error.hpp"

namespace dropslot::server
{

    namespace
    {
        constexpr auto kUploadsDir = "uploads";
        constexpr std::size_t kSessionIdBytes = 16;

        std::int64_t to_unix_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point from_unix_seconds(std::int64_t seconds)
        {
            return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
        }

        nlohmann::json to_json(const UploadSession &session)
        {
            return {
                {"id", session.id},
                {"scope", session.scope},
                {"filename", session.filename},
                {"content_type", session.content_type},
                {"total_size", session.total_size},
                {"chunk_size", session.chunk_size},
                {"total_chunks", session.total_chunks},
                {"received_chunks", session.received_chunks},
                {"created_at", to_unix_seconds(session.created_at)},
                {"updated_at", to_unix_seconds(session.updated_at)},
            };
        }

        UploadSession session_from_json(const nlohmann::json &json)
        {
            UploadSession session{};
            session.id = json.at("id").get<std::string>();
            session.scope = json.at("scope").get<OwnerScope>();
            session.filename = json.at("filename").get<std::string>();
            session.content_type = json.value("content_type", std::string{});
            session.total_size = json.at("total_size").get<std::uint64_t>();
            session.chunk_size = json.at("chunk_size").get<std::uint64_t>();
            session.total_chunks = json.at("total_chunks").get<std::uint64_t>();
            for (const auto &index : json.value("received_chunks", nlohmann::json::array()))
            {
                if (index.is_number_unsigned())
                {
                    session.received_chunks.insert(index.get<std::uint64_t>());
                }
            }
            session.created_at = from_unix_seconds(json.value("created_at", std::int64_t{0}));
            session.updated_at = from_unix_seconds(json.value("updated_at", std::int64_t{0}));
            return session;
        }

    } // namespace

    std::vector<std::uint64_t> UploadSession::missing_chunks() const
    {
        std::vector<std::uint64_t> missing;
        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            if (!received_chunks.contains(index))
            {
                missing.push_back(index);
            }
        }
        return missing;
    }

    bool UploadSession::is_expired(std::chrono::seconds ttl, std::chrono::system_clock::time_point now) const
    {
        return ttl.count() > 0 && updated_at < now - ttl;
    }

    UploadSessionRegistry::UploadSessionRegistry(std::filesystem::path metadata_root)
        : registry_dir_(std::move(metadata_root) / kUploadsDir)
    {
        std::filesystem::create_directories(registry_dir_);
        load_existing();
    }

    std::optional<UploadSession> UploadSessionRegistry::find(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<UploadSession> UploadSessionRegistry::find_reusable(const OwnerScope &scope,
                                                                      const std::string &filename,
                                                                      std::uint64_t total_size,
                                                                      std::uint64_t chunk_size,
                                                                      const std::optional<std::string> &existing_id) const
    {
        if (!existing_id || existing_id->empty())
        {
            return std::nullopt;
        }
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(*existing_id);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        const auto &session = it->second;
        if (session.scope != scope || session.filename != filename || session.total_size != total_size ||
            session.chunk_size != chunk_size)
        {
            return std::nullopt;
        }
        return session;
    }

    UploadSession UploadSessionRegistry::create(const OwnerScope &scope, const std::string &filename,
                                                const std::string &content_type, std::uint64_t total_size,
                                                std::uint64_t chunk_size, std::uint64_t total_chunks)
    {
        UploadSession session{};
        session.scope = scope;
        session.filename = filename;
        session.content_type = content_type;
        session.total_size = total_size;
        session.chunk_size = chunk_size;
        session.total_chunks = total_chunks;
        session.created_at = std::chrono::system_clock::now();
        session.updated_at = session.created_at;

        std::lock_guard lock(mutex_);
        do
        {
            session.id = crypto::random_token(kSessionIdBytes);
        } while (sessions_.contains(session.id));

        persist_locked(session);
        sessions_.emplace(session.id, session);
        return session;
    }

    UploadSession UploadSessionRegistry::reconcile_on_resume(const std::string &session_id, std::uint64_t total_chunks)
    {
        std::lock_guard lock(mutex_);
        auto updated = require_locked(session_id);
        updated.total_chunks = total_chunks;
        std::erase_if(updated.received_chunks, [total_chunks](std::uint64_t index)
                      { return index >= total_chunks; });
        updated.updated_at = std::chrono::system_clock::now();
        persist_locked(updated);
        sessions_[session_id] = updated;
        return updated;
    }

    UploadSession UploadSessionRegistry::record_chunk(const std::string &session_id, std::uint64_t index)
    {
        std::lock_guard lock(mutex_);
        auto updated = require_locked(session_id);
        if (index >= updated.total_chunks)
        {
            throw ServiceError(dropslot::ErrorCode::BadRequest, "Chunk index out of range");
        }
        updated.received_chunks.insert(index);
        updated.updated_at = std::chrono::system_clock::now();
        persist_locked(updated);
        sessions_[session_id] = updated;
        return updated;
    }

    void UploadSessionRegistry::remove(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        remove_row_locked(session_id);
        sessions_.erase(session_id);
    }

    std::vector<UploadSession> UploadSessionRegistry::list_expired(std::chrono::seconds ttl) const
    {
        std::vector<UploadSession> expired;
        const auto now = std::chrono::system_clock::now();
        std::lock_guard lock(mutex_);
        for (const auto &[id, session] : sessions_)
        {
            if (session.is_expired(ttl, now))
            {
                expired.push_back(session);
            }
        }
        return expired;
    }

    std::vector<UploadSession> UploadSessionRegistry::delete_expired(std::chrono::seconds ttl)
    {
        std::vector<UploadSession> expired;
        const auto now = std::chrono::system_clock::now();
        std::lock_guard lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (it->second.is_expired(ttl, now))
            {
                remove_row_locked(it->first);
                expired.push_back(std::move(it->second));
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return expired;
    }

    std::size_t UploadSessionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::filesystem::path UploadSessionRegistry::row_path(const std::string &session_id) const
    {
        return registry_dir_ / (session_id + ".json");
    }

    void UploadSessionRegistry::load_existing()
    {
        std::lock_guard lock(mutex_);
        for (const auto &entry : std::filesystem::directory_iterator(registry_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                continue;
            }
            try
            {
                nlohmann::json json;
                in >> json;
                auto session = session_from_json(json);
                sessions_[session.id] = std::move(session);
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping unreadable upload row {}: {}", entry.path().string(), ex.what());
            }
        }
        spdlog::debug("Loaded {} upload sessions from {}", sessions_.size(), registry_dir_.string());
    }

    void UploadSessionRegistry::persist_locked(const UploadSession &session) const
    {
        const auto path = row_path(session.id);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << to_json(session).dump(2);
            out.flush();
            if (!out)
            {
                throw ServiceError(dropslot::ErrorCode::Internal, "Failed to persist upload " + session.id);
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            throw ServiceError(dropslot::ErrorCode::Internal, "Failed to persist upload " + session.id + ": " + ec.message());
        }
    }

    void UploadSessionRegistry::remove_row_locked(const std::string &session_id) const
    {
        std::error_code ec;
        std::filesystem::remove(row_path(session_id), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove upload row {}: {}", session_id, ec.message());
        }
    }

    UploadSession &UploadSessionRegistry::require_locked(const std::string &session_id)
    {
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            throw ServiceError(dropslot::ErrorCode::NotFound, "Unknown upload");
        }
        return it->second;
    }

} // namespace dropslot::server
