#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dropslot::server
{

    /// Username to password hash table kept in `<metadata_root>/users.json`.
    /// The file is read lazily on first use and rewritten through a temporary file.
    class UserStore
    {
    public:
        explicit UserStore(std::filesystem::path metadata_root);

        bool authenticate(const std::string &username, const std::string &password) const;
        /// On failure @p message says why; invalid usernames, empty passwords and taken names are refused.
        bool register_user(const std::string &username, const std::string &password, std::string &message);

        /// Letters, digits, '_', '-' and '.', at most 64 characters.
        static bool is_valid_username(const std::string &username);

    private:
        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, std::string> users_;
    };

} // namespace dropslot::server
