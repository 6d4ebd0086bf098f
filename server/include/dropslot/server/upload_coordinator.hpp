#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "dropslot/server/chunk_store.hpp"
#include "dropslot/server/config.hpp"
#include "dropslot/server/keyed_locks.hpp"
#include "dropslot/server/owner_scope.hpp"
#include "dropslot/server/share_slot_manager.hpp"
#include "dropslot/server/upload_session_registry.hpp"

namespace dropslot::server
{

    struct StartRequest
    {
        OwnerScope scope;
        std::string filename;
        std::string content_type;
        std::int64_t total_size{};
        std::int64_t chunk_size{};
        std::optional<std::string> upload_id;
    };

    struct StartResult
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::vector<std::uint64_t> received_chunks;
        bool resumed{};
    };

    struct ChunkReceipt
    {
        std::uint64_t received_count{};
        std::uint64_t total_chunks{};
    };

    struct CompletionResult
    {
        std::string name;
        std::uint64_t size{};
        std::string content_hash;
    };

    /**
     * Drives resumable uploads: start/resume, chunk acceptance, assembly on completion and
     * garbage collection of abandoned sessions.
     *
     * A session is Created/Receiving while its registry row exists, Completing for the
     * duration of complete(), and Finished once the artifact is published and the row and
     * chunks are gone. A failed completion keeps the row so the client can fill the gaps and
     * retry. All failures are reported as ServiceError.
     */
    class UploadCoordinator
    {
    public:
        UploadCoordinator(UploadSessionRegistry &registry, ChunkStore &chunks, ShareSlotManager &slots,
                          UploadLimits limits);

        StartResult start(const StartRequest &request);

        ChunkReceipt put_chunk(const OwnerScope &scope, const std::string &upload_id, std::int64_t index,
                               std::span<const std::byte> data);

        CompletionResult complete(const OwnerScope &scope, const std::string &upload_id);

        /// Removes expired sessions with their chunks, and chunk directories nobody owns.
        /// Best effort: failures are logged. Returns the number of sessions reclaimed.
        std::size_t sweep_expired();

        const UploadLimits &limits() const noexcept { return limits_; }

        static std::uint64_t compute_total_chunks(std::uint64_t total_size, std::uint64_t chunk_size);

    private:
        UploadSession require_owned(const OwnerScope &scope, const std::string &upload_id) const;

        UploadSessionRegistry &registry_;
        ChunkStore &chunks_;
        ShareSlotManager &slots_;
        UploadLimits limits_;
        KeyedLocks session_locks_;
    };

} // namespace dropslot::server
