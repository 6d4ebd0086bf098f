#include "dropslot/server/user_store.hpp"

#include <algorithm>
#include <cctype>
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
        constexpr auto kUsersFile = "users.json";
        constexpr std::size_t kMaxUsernameLength = 64;
    } // namespace

    UserStore::UserStore(std::filesystem::path metadata_root) : database_path_(metadata_root / kUsersFile)
    {
        std::filesystem::create_directories(metadata_root);
    }

    bool UserStore::is_valid_username(const std::string &username)
    {
        if (username.empty() || username.size() > kMaxUsernameLength)
        {
            return false;
        }
        return std::all_of(username.begin(), username.end(), [](char ch)
                           {
                               const auto byte = static_cast<unsigned char>(ch);
                               return std::isalnum(byte) != 0 || ch == '_' || ch == '-' || ch == '.'; });
    }

    bool UserStore::authenticate(const std::string &username, const std::string &password) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = users_.find(username);
        if (it == users_.end())
        {
            return false;
        }
        return crypto::verify_password(password, it->second);
    }

    bool UserStore::register_user(const std::string &username, const std::string &password, std::string &message)
    {
        if (!is_valid_username(username))
        {
            message = "Invalid username";
            return false;
        }
        if (password.empty())
        {
            message = "Password must not be empty";
            return false;
        }
        std::lock_guard lock(mutex_);
        load_locked();
        if (users_.contains(username))
        {
            message = "User already exists";
            return false;
        }
        users_.emplace(username, crypto::hash_password(password));
        persist_locked();
        spdlog::info("Registered user {}", username);
        message.clear();
        return true;
    }

    void UserStore::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        users_.clear();
        std::ifstream in(database_path_);
        if (in.is_open())
        {
            try
            {
                nlohmann::json json;
                in >> json;
                if (json.is_object())
                {
                    for (const auto &[key, value] : json.items())
                    {
                        users_[key] = value.get<std::string>();
                    }
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::error("User database {} is unreadable: {}", database_path_.string(), ex.what());
                throw ServiceError(dropslot::ErrorCode::Internal, "User database is unreadable");
            }
        }
        loaded_ = true;
    }

    void UserStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[user, hash] : users_)
        {
            json[user] = hash;
        }
        auto temp_path = database_path_;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << json.dump(2);
            out.flush();
            if (!out)
            {
                throw ServiceError(dropslot::ErrorCode::Internal, "Failed to write user database");
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, database_path_, ec);
        if (ec)
        {
            throw ServiceError(dropslot::ErrorCode::Internal, "Failed to write user database: " + ec.message());
        }
    }

} // namespace dropslot::server
