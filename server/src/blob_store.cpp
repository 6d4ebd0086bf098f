#include "dropslot/server/blob_store.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "dropslot/server/service_error.hpp"

namespace dropslot::server
{

    BlobStore::BlobStore(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(base_);
    }

    std::filesystem::path BlobStore::resolve(const std::string &path) const
    {
        std::filesystem::path relative = path;
        if (!path.empty() && relative.is_absolute())
        {
            relative = relative.lexically_relative(relative.root_path());
        }

        std::filesystem::path sanitized = base_;
        bool has_name = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw ServiceError(dropslot::ErrorCode::BadRequest, "Path traversal detected");
            }
            sanitized /= part;
            has_name = true;
        }
        if (!has_name)
        {
            throw ServiceError(dropslot::ErrorCode::BadRequest, "Empty blob path");
        }
        return sanitized;
    }

    void BlobStore::save(const std::string &path, std::span<const std::byte> data) const
    {
        const auto target = resolve(path);
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw ServiceError(dropslot::ErrorCode::Internal, "Cannot open blob for writing: " + path);
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out)
        {
            out.close();
            std::error_code ec;
            std::filesystem::remove(target, ec);
            throw ServiceError(dropslot::ErrorCode::Internal, "Failed to write blob: " + path);
        }
    }

    void BlobStore::adopt(const std::string &path, const std::filesystem::path &source) const
    {
        const auto target = resolve(path);
        std::filesystem::create_directories(target.parent_path());

        std::error_code ec;
        std::filesystem::rename(source, target, ec);
        if (!ec)
        {
            return;
        }
        // rename fails across file systems; fall back to a copy
        spdlog::debug("Rename into blob store failed ({}), copying {}", ec.message(), source.string());
        std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(target, ignored);
            throw ServiceError(dropslot::ErrorCode::Internal, "Failed to store blob: " + ec.message());
        }
        std::filesystem::remove(source, ec);
    }

    std::ifstream BlobStore::open(const std::string &path) const
    {
        std::ifstream in(resolve(path), std::ios::binary);
        if (!in.is_open())
        {
            throw ServiceError(dropslot::ErrorCode::NotFound, "Blob not found: " + path);
        }
        return in;
    }

    bool BlobStore::remove(const std::string &path) const
    {
        std::error_code ec;
        const auto target = resolve(path);
        std::filesystem::remove(target, ec);
        if (ec)
        {
            spdlog::error("Failed to delete blob {}: {}", path, ec.message());
            return false;
        }
        spdlog::info("Deleted blob {}", path);
        return true;
    }

    bool BlobStore::exists(const std::string &path) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(resolve(path), ec);
    }

    std::uint64_t BlobStore::size(const std::string &path) const
    {
        std::error_code ec;
        const auto value = std::filesystem::file_size(resolve(path), ec);
        if (ec)
        {
            throw ServiceError(dropslot::ErrorCode::NotFound, "Blob not found: " + path);
        }
        return value;
    }

} // namespace dropslot::server
