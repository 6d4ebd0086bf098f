#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <vector>

namespace dropslot::server
{

    /**
     * Filesystem storage for the chunks of in-progress uploads.
     *
     * Layout: <root>/<session id>/000000.part, one file per chunk index, plus
     * <root>/<session id>.tmp while an upload is being assembled. The store keeps no
     * in-memory state; the registry decides which chunks exist logically.
     */
    class ChunkStore
    {
    public:
        explicit ChunkStore(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        /// Writes or overwrites a chunk. The bytes land in a temporary file that is flushed
        /// and renamed over the final name, so a reader never sees a partial chunk.
        void put(const std::string &session_id, std::uint64_t index, std::span<const std::byte> data) const;

        bool exists(const std::string &session_id, std::uint64_t index) const;

        std::uint64_t size(const std::string &session_id, std::uint64_t index) const;

        std::ifstream open(const std::string &session_id, std::uint64_t index) const;

        /// Drops the session directory and any leftover assembly file. Failures are logged.
        void remove_all(const std::string &session_id) const;

        /// Session ids whose directory or assembly file was last modified before now - max_age.
        std::vector<std::string> stale_sessions(std::chrono::seconds max_age) const;

        std::filesystem::path session_dir(const std::string &session_id) const;
        std::filesystem::path chunk_path(const std::string &session_id, std::uint64_t index) const;
        std::filesystem::path assembly_path(const std::string &session_id) const;

        static std::string chunk_file_name(std::uint64_t index);

    private:
        std::filesystem::path root_;
    };

} // namespace dropslot::server
