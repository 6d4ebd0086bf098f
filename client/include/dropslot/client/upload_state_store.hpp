#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dropslot::client
{

    /// Remembers the server upload id of unfinished uploads so that a later run resumes them.
    /// Entries are keyed by (identity, absolute local path, file size) and kept in a JSON file.
    class UploadStateStore
    {
    public:
        struct Entry
        {
            std::string identity;
            std::filesystem::path local_path;
            std::uint64_t total_size{};
            std::string upload_id;
        };

        UploadStateStore();
        explicit UploadStateStore(std::filesystem::path state_path);

        std::optional<Entry> find(const std::string &identity, const std::filesystem::path &local_path,
                                  std::uint64_t total_size) const;

        void remember(const std::string &identity, const std::filesystem::path &local_path, std::uint64_t total_size,
                      const std::string &upload_id);

        void forget(const std::string &identity, const std::filesystem::path &local_path, std::uint64_t total_size);

        const std::vector<Entry> &entries() const noexcept { return entries_; }

        const std::filesystem::path &state_path() const noexcept { return state_path_; }

    private:
        static std::filesystem::path default_state_path();
        void load();
        void save() const;
        std::vector<Entry>::const_iterator find_entry(const std::string &identity, const std::filesystem::path &local_path,
                                                      std::uint64_t total_size) const;
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace dropslot::client
