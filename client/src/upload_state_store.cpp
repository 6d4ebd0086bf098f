#include "dropslot/client/upload_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace dropslot::client
{

    UploadStateStore::UploadStateStore() : UploadStateStore(default_state_path()) {}

    UploadStateStore::UploadStateStore(std::filesystem::path state_path) : state_path_(std::move(state_path))
    {
        load();
    }

    std::optional<UploadStateStore::Entry> UploadStateStore::find(const std::string &identity,
                                                                  const std::filesystem::path &local_path,
                                                                  std::uint64_t total_size) const
    {
        auto it = find_entry(identity, normalize_path(local_path), total_size);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void UploadStateStore::remember(const std::string &identity, const std::filesystem::path &local_path,
                                    std::uint64_t total_size, const std::string &upload_id)
    {
        const auto normalized_local = normalize_path(local_path);
        auto it = find_entry(identity, normalized_local, total_size);
        if (it == entries_.end())
        {
            entries_.push_back(Entry{identity, normalized_local, total_size, upload_id});
        }
        else
        {
            if (it->upload_id == upload_id)
            {
                return;
            }
            entries_[static_cast<std::size_t>(it - entries_.begin())].upload_id = upload_id;
        }
        save();
    }

    void UploadStateStore::forget(const std::string &identity, const std::filesystem::path &local_path,
                                  std::uint64_t total_size)
    {
        auto it = find_entry(identity, normalize_path(local_path), total_size);
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::filesystem::path UploadStateStore::default_state_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".dropslot" / "uploads.json";
        }
        return std::filesystem::path(".dropslot") / "uploads.json";
    }

    void UploadStateStore::load()
    {
        entries_.clear();
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        // a damaged state file only costs the ability to resume
        auto json = nlohmann::json::parse(in, nullptr, false);
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            if (!item.is_object())
            {
                continue;
            }
            Entry entry;
            entry.identity = item.value("identity", std::string{});
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.total_size = item.value("size", 0ULL);
            entry.upload_id = item.value("upload_id", std::string{});
            if (!entry.identity.empty() && !entry.upload_id.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void UploadStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"identity", entry.identity},
                            {"local", entry.local_path.generic_string()},
                            {"size", entry.total_size},
                            {"upload_id", entry.upload_id}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (out.is_open())
        {
            out << json.dump(2);
        }
    }

    std::vector<UploadStateStore::Entry>::const_iterator UploadStateStore::find_entry(
        const std::string &identity, const std::filesystem::path &local_path, std::uint64_t total_size) const
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.identity == identity && entry.local_path == local_path &&
                                     entry.total_size == total_size; });
    }

    std::filesystem::path UploadStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace dropslot::client
