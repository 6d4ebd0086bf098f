#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "dropslot/server/owner_scope.hpp"

namespace dropslot::server
{

    struct UploadSession
    {
        std::string id;
        OwnerScope scope;
        std::string filename;
        std::string content_type;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::set<std::uint64_t> received_chunks;
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point updated_at{};

        std::vector<std::uint64_t> missing_chunks() const;

        bool is_expired(std::chrono::seconds ttl, std::chrono::system_clock::time_point now) const;
    };

    /**
     * Durable record of upload sessions, one JSON row per session below
     * <metadata root>/uploads. The registry is the source of truth for which chunks of a
     * session were received; every mutation is persisted before it returns.
     */
    class UploadSessionRegistry
    {
    public:
        explicit UploadSessionRegistry(std::filesystem::path metadata_root);

        std::optional<UploadSession> find(const std::string &session_id) const;

        /// Returns the session named by @p existing_id when it belongs to @p scope and matches the
        /// declared file exactly; std::nullopt means a fresh session has to be created.
        std::optional<UploadSession> find_reusable(const OwnerScope &scope, const std::string &filename,
                                                   std::uint64_t total_size, std::uint64_t chunk_size,
                                                   const std::optional<std::string> &existing_id) const;

        UploadSession create(const OwnerScope &scope, const std::string &filename, const std::string &content_type,
                             std::uint64_t total_size, std::uint64_t chunk_size, std::uint64_t total_chunks);

        UploadSession reconcile_on_resume(const std::string &session_id, std::uint64_t total_chunks);

        UploadSession record_chunk(const std::string &session_id, std::uint64_t index);

        void remove(const std::string &session_id);

        std::vector<UploadSession> list_expired(std::chrono::seconds ttl) const;

        std::vector<UploadSession> delete_expired(std::chrono::seconds ttl);

        std::size_t size() const;

    private:
        std::filesystem::path row_path(const std::string &session_id) const;

        void load_existing();
        void persist_locked(const UploadSession &session) const;
        void remove_row_locked(const std::string &session_id) const;
        UploadSession &require_locked(const std::string &session_id);

        std::filesystem::path registry_dir_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadSession> sessions_;
    };

} // namespace dropslot::server
