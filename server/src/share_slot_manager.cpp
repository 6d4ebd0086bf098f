#include "dropslot/server/share_slot_manager.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dropslot/crypto.hpp"
#include "dropslot/server/service_error.hpp"

namespace dropslot::server
{

    namespace
    {
        constexpr auto kSlotsDir = "slots";
        constexpr std::size_t kBlobTokenBytes = 8;
        constexpr std::size_t kMaxNameLength = 120;

        std::string artifact_kind_label(ArtifactKind kind)
        {
            switch (kind)
            {
            case ArtifactKind::File:
                return "file";
            case ArtifactKind::Text:
                return "text";
            case ArtifactKind::None:
                break;
            }
            return "none";
        }

        ArtifactKind artifact_kind_from_label(const std::string &label)
        {
            if (label == "file")
            {
                return ArtifactKind::File;
            }
            if (label == "text")
            {
                return ArtifactKind::Text;
            }
            return ArtifactKind::None;
        }

        std::int64_t to_unix_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        nlohmann::json slot_to_json(const ShareSlot &slot)
        {
            nlohmann::json json{
                {"scope", slot.scope},
                {"kind", artifact_kind_label(slot.artifact.kind)},
                {"updated_at", to_unix_seconds(slot.updated_at)},
            };
            if (slot.artifact.kind == ArtifactKind::File)
            {
                json["blob"] = slot.artifact.blob_path;
                json["name"] = slot.artifact.name;
                json["size"] = slot.artifact.size;
            }
            else if (slot.artifact.kind == ArtifactKind::Text)
            {
                json["text"] = slot.artifact.text;
            }
            return json;
        }

        ShareSlot slot_from_json(const nlohmann::json &json)
        {
            ShareSlot slot{};
            slot.scope = json.at("scope").get<OwnerScope>();
            slot.artifact.kind = artifact_kind_from_label(json.value("kind", std::string{"none"}));
            slot.artifact.blob_path = json.value("blob", std::string{});
            slot.artifact.name = json.value("name", std::string{});
            slot.artifact.size = json.value("size", std::uint64_t{0});
            slot.artifact.text = json.value("text", std::string{});
            slot.updated_at = std::chrono::system_clock::time_point{
                std::chrono::seconds{json.value("updated_at", std::int64_t{0})}};
            return slot;
        }

        // Keeps the display name readable while making it safe as a single path component.
        std::string sanitize_name(const std::string &name)
        {
            auto base = std::filesystem::path(name).filename().string();
            std::string result;
            result.reserve(std::min(base.size(), kMaxNameLength));
            for (const auto ch : base)
            {
                if (result.size() == kMaxNameLength)
                {
                    break;
                }
                const auto byte = static_cast<unsigned char>(ch);
                if (std::isalnum(byte) != 0 || ch == '.' || ch == '-' || ch == '_')
                {
                    result.push_back(ch);
                }
                else
                {
                    result.push_back('_');
                }
            }
            if (result.empty() || result == "." || result == "..")
            {
                return "file";
            }
            return result;
        }

        std::string display_name(const std::string &name)
        {
            auto base = std::filesystem::path(name).filename().string();
            return base.empty() ? std::string{"file"} : base;
        }

    } // namespace

    ShareSlotManager::ShareSlotManager(std::filesystem::path metadata_root, BlobStore &blobs, SlotPolicy policy)
        : slots_dir_(std::move(metadata_root) / kSlotsDir), blobs_(blobs), policy_(policy)
    {
        std::filesystem::create_directories(slots_dir_);
    }

    ShareSlot ShareSlotManager::get_or_create(const OwnerScope &scope)
    {
        auto guard = slot_locks_.acquire(scope.storage_key());
        return load_locked(scope);
    }

    bool ShareSlotManager::expire_if_stale(const OwnerScope &scope, std::chrono::seconds ttl)
    {
        auto guard = slot_locks_.acquire(scope.storage_key());
        auto slot = load_locked(scope);
        return expire_locked(slot, ttl);
    }

    template <typename Writer>
    Artifact ShareSlotManager::replace_file(const OwnerScope &scope, const std::string &name, Writer &&write_blob)
    {
        auto guard = slot_locks_.acquire(scope.storage_key());
        auto slot = load_locked(scope);
        expire_locked(slot, ttl_for(scope));

        drop_blob(slot.artifact);
        slot.artifact = Artifact{};

        Artifact artifact{};
        artifact.kind = ArtifactKind::File;
        artifact.name = display_name(name);
        artifact.blob_path = new_blob_path(scope, name);
        try
        {
            write_blob(artifact.blob_path);
            artifact.size = blobs_.size(artifact.blob_path);
        }
        catch (const std::exception &)
        {
            // the new blob may already sit on disk when only the size lookup failed
            std::error_code ec;
            if (std::filesystem::exists(blobs_.resolve(artifact.blob_path), ec))
            {
                blobs_.remove(artifact.blob_path);
            }
            // the old blob is already gone; leave the slot empty rather than dangling
            slot.updated_at = std::chrono::system_clock::now();
            store(slot);
            throw;
        }

        slot.artifact = artifact;
        slot.updated_at = std::chrono::system_clock::now();
        store(slot);
        spdlog::info("Published file '{}' ({} bytes) to {} slot", artifact.name, artifact.size, scope.describe());
        return artifact;
    }

    Artifact ShareSlotManager::set_file(const OwnerScope &scope, const std::filesystem::path &source,
                                        const std::string &name)
    {
        return replace_file(scope, name, [this, &source](const std::string &blob_path)
                            { blobs_.adopt(blob_path, source); });
    }

    Artifact ShareSlotManager::set_file_bytes(const OwnerScope &scope, const std::string &name,
                                              std::span<const std::byte> data)
    {
        return replace_file(scope, name, [this, data](const std::string &blob_path)
                            { blobs_.save(blob_path, data); });
    }

    void ShareSlotManager::set_text(const OwnerScope &scope, std::string text)
    {
        auto guard = slot_locks_.acquire(scope.storage_key());
        auto slot = load_locked(scope);
        expire_locked(slot, ttl_for(scope));

        drop_blob(slot.artifact);
        slot.artifact = Artifact{};
        slot.artifact.kind = ArtifactKind::Text;
        slot.artifact.size = text.size();
        slot.artifact.text = std::move(text);
        slot.updated_at = std::chrono::system_clock::now();
        store(slot);
        spdlog::info("Published text ({} bytes) to {} slot", slot.artifact.size, scope.describe());
    }

    void ShareSlotManager::clear(const OwnerScope &scope)
    {
        auto guard = slot_locks_.acquire(scope.storage_key());
        auto slot = load_locked(scope);
        expire_locked(slot, ttl_for(scope));
        if (slot.artifact.kind == ArtifactKind::None)
        {
            return;
        }
        drop_blob(slot.artifact);
        slot.artifact = Artifact{};
        slot.updated_at = std::chrono::system_clock::now();
        store(slot);
        spdlog::info("Cleared {} slot", scope.describe());
    }

    Artifact ShareSlotManager::read(const OwnerScope &scope)
    {
        auto guard = slot_locks_.acquire(scope.storage_key());
        auto slot = load_locked(scope);
        expire_locked(slot, ttl_for(scope));
        return slot.artifact;
    }

    OpenedArtifact ShareSlotManager::open_file(const OwnerScope &scope)
    {
        auto guard = slot_locks_.acquire(scope.storage_key());
        auto slot = load_locked(scope);
        expire_locked(slot, ttl_for(scope));
        if (slot.artifact.kind != ArtifactKind::File)
        {
            throw ServiceError(dropslot::ErrorCode::NotFound, "No file shared");
        }
        // the stream stays valid if a later replace unlinks the blob
        return OpenedArtifact{slot.artifact, blobs_.open(slot.artifact.blob_path)};
    }

    std::chrono::seconds ShareSlotManager::ttl_for(const OwnerScope &scope) const noexcept
    {
        return scope.is_public() ? policy_.public_ttl : policy_.user_ttl;
    }

    ShareSlot ShareSlotManager::load_locked(const OwnerScope &scope)
    {
        const auto key = scope.storage_key();
        {
            std::lock_guard lock(mutex_);
            if (auto it = slots_.find(key); it != slots_.end())
            {
                return it->second;
            }
        }

        ShareSlot slot{};
        slot.scope = scope;
        slot.updated_at = std::chrono::system_clock::now();

        const auto path = row_path(scope);
        std::ifstream in(path);
        if (in.is_open())
        {
            try
            {
                nlohmann::json json;
                in >> json;
                auto loaded = slot_from_json(json);
                if (loaded.scope == scope)
                {
                    slot = std::move(loaded);
                }
                else
                {
                    spdlog::warn("Slot row {} belongs to another scope, ignoring it", path.string());
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping unreadable slot row {}: {}", path.string(), ex.what());
            }
        }

        std::lock_guard lock(mutex_);
        slots_[key] = slot;
        return slot;
    }

    void ShareSlotManager::store(const ShareSlot &slot)
    {
        const auto path = row_path(slot.scope);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << slot_to_json(slot).dump(2);
            out.flush();
            if (!out)
            {
                throw ServiceError(dropslot::ErrorCode::Internal, "Failed to persist slot " + slot.scope.describe());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            throw ServiceError(dropslot::ErrorCode::Internal,
                               "Failed to persist slot " + slot.scope.describe() + ": " + ec.message());
        }

        std::lock_guard lock(mutex_);
        slots_[slot.scope.storage_key()] = slot;
    }

    bool ShareSlotManager::expire_locked(ShareSlot &slot, std::chrono::seconds ttl)
    {
        if (ttl.count() <= 0 || slot.artifact.kind == ArtifactKind::None)
        {
            return false;
        }
        if (std::chrono::system_clock::now() - slot.updated_at <= ttl)
        {
            return false;
        }
        spdlog::info("Artifact in {} slot expired", slot.scope.describe());
        drop_blob(slot.artifact);
        slot.artifact = Artifact{};
        slot.updated_at = std::chrono::system_clock::now();
        store(slot);
        return true;
    }

    void ShareSlotManager::drop_blob(const Artifact &artifact) const
    {
        if (artifact.kind != ArtifactKind::File || artifact.blob_path.empty())
        {
            return;
        }
        try
        {
            blobs_.remove(artifact.blob_path);
        }
        catch (const ServiceError &ex)
        {
            spdlog::warn("Ignoring invalid blob path {}: {}", artifact.blob_path, ex.what());
        }
    }

    std::string ShareSlotManager::new_blob_path(const OwnerScope &scope, const std::string &name) const
    {
        auto file_name = crypto::random_token(kBlobTokenBytes) + "_" + sanitize_name(name);
        if (scope.is_public())
        {
            return "public/" + file_name;
        }
        return "users/" + scope.storage_key().substr(5) + "/" + file_name;
    }

    std::filesystem::path ShareSlotManager::row_path(const OwnerScope &scope) const
    {
        return slots_dir_ / (scope.storage_key() + ".json");
    }

} // namespace dropslot::server
