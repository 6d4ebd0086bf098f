#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>

#include "dropslot/server/blob_store.hpp"
#include "dropslot/server/config.hpp"
#include "dropslot/server/keyed_locks.hpp"
#include "dropslot/server/owner_scope.hpp"

namespace dropslot::server
{

    enum class ArtifactKind : std::uint8_t
    {
        None,
        File,
        Text
    };

    struct Artifact
    {
        ArtifactKind kind{ArtifactKind::None};
        std::string blob_path;
        std::string name;
        std::uint64_t size{};
        std::string text;
    };

    struct ShareSlot
    {
        OwnerScope scope;
        Artifact artifact;
        std::chrono::system_clock::time_point updated_at{};
    };

    struct OpenedArtifact
    {
        Artifact artifact;
        std::ifstream stream;
    };

    /**
     * Owns the single published artifact of every scope. Slots are created on first access and
     * persisted as JSON rows below <metadata root>/slots. Each slot is guarded by its own lock,
     * so replacing the artifact (delete old blob, store new one, write row) never interleaves
     * with another writer of the same slot.
     *
     * Expiry is lazy: every read and write first clears an artifact older than the scope's TTL.
     */
    class ShareSlotManager
    {
    public:
        ShareSlotManager(std::filesystem::path metadata_root, BlobStore &blobs, SlotPolicy policy);

        ShareSlot get_or_create(const OwnerScope &scope);

        /// Clears the artifact when it is older than @p ttl. Returns true when something expired.
        bool expire_if_stale(const OwnerScope &scope, std::chrono::seconds ttl);

        Artifact set_file(const OwnerScope &scope, const std::filesystem::path &source, const std::string &name);

        Artifact set_file_bytes(const OwnerScope &scope, const std::string &name, std::span<const std::byte> data);

        void set_text(const OwnerScope &scope, std::string text);

        void clear(const OwnerScope &scope);

        Artifact read(const OwnerScope &scope);

        /// Opens the current file artifact; throws ServiceError(NotFound) when the slot holds no file.
        OpenedArtifact open_file(const OwnerScope &scope);

        std::chrono::seconds ttl_for(const OwnerScope &scope) const noexcept;

    private:
        template <typename Writer>
        Artifact replace_file(const OwnerScope &scope, const std::string &name, Writer &&write_blob);

        ShareSlot load_locked(const OwnerScope &scope);
        void store(const ShareSlot &slot);
        bool expire_locked(ShareSlot &slot, std::chrono::seconds ttl);
        void drop_blob(const Artifact &artifact) const;
        std::string new_blob_path(const OwnerScope &scope, const std::string &name) const;
        std::filesystem::path row_path(const OwnerScope &scope) const;

        std::filesystem::path slots_dir_;
        BlobStore &blobs_;
        SlotPolicy policy_;
        KeyedLocks slot_locks_;
        std::mutex mutex_;
        std::unordered_map<std::string, ShareSlot> slots_;
    };

} // namespace dropslot::server
