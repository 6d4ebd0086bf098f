#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>

namespace dropslot::server
{

    /// Published file blobs addressed by relative path below a root directory.
    class BlobStore
    {
    public:
        explicit BlobStore(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return base_; }

        void save(const std::string &path, std::span<const std::byte> data) const;

        /// Moves an existing local file into the store, copying when a rename is impossible.
        void adopt(const std::string &path, const std::filesystem::path &source) const;

        std::ifstream open(const std::string &path) const;

        /// Returns false when the blob could not be removed; the failure is logged.
        bool remove(const std::string &path) const;

        bool exists(const std::string &path) const;

        std::uint64_t size(const std::string &path) const;

        /// Maps a relative blob path onto the file system, rejecting traversal outside the root.
        std::filesystem::path resolve(const std::string &path) const;

    private:
        std::filesystem::path base_;
    };

} // namespace dropslot::server
