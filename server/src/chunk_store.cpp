#include "dropslot/server/chunk_store.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "dropslot/crypto.hpp"
#include "dropslot/server/service_error.hpp"

namespace dropslot::server
{

    namespace
    {
        constexpr auto kAssemblySuffix = ".tmp";
        constexpr std::size_t kTempTokenBytes = 8;

        // Session ids are server generated hex tokens; anything else never reaches the disk.
        bool is_valid_session_id(const std::string &session_id)
        {
            return !session_id.empty() && session_id.size() <= 64 &&
                   std::all_of(session_id.begin(), session_id.end(), [](char ch)
                               { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; });
        }

        void ensure_valid_session_id(const std::string &session_id)
        {
            if (!is_valid_session_id(session_id))
            {
                throw ServiceError(dropslot::ErrorCode::BadRequest, "Malformed upload id");
            }
        }
    } // namespace

    ChunkStore::ChunkStore(std::filesystem::path root) : root_(std::move(root))
    {
        std::filesystem::create_directories(root_);
    }

    std::string ChunkStore::chunk_file_name(std::uint64_t index)
    {
        std::ostringstream oss;
        oss << std::setw(6) << std::setfill('0') << index << ".part";
        return oss.str();
    }

    std::filesystem::path ChunkStore::session_dir(const std::string &session_id) const
    {
        ensure_valid_session_id(session_id);
        return root_ / session_id;
    }

    std::filesystem::path ChunkStore::chunk_path(const std::string &session_id, std::uint64_t index) const
    {
        return session_dir(session_id) / chunk_file_name(index);
    }

    std::filesystem::path ChunkStore::assembly_path(const std::string &session_id) const
    {
        ensure_valid_session_id(session_id);
        return root_ / (session_id + kAssemblySuffix);
    }

    void ChunkStore::put(const std::string &session_id, std::uint64_t index, std::span<const std::byte> data) const
    {
        const auto dir = session_dir(session_id);
        const auto final_path = dir / chunk_file_name(index);
        // one temporary file per writer; concurrent retries of an index must not share it
        const auto temp_path =
            dir / (chunk_file_name(index) + "." + crypto::random_token(kTempTokenBytes) + kAssemblySuffix);

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            throw ServiceError(dropslot::ErrorCode::Internal, "Cannot create chunk directory: " + ec.message());
        }

        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw ServiceError(dropslot::ErrorCode::Internal, "Cannot open chunk file for writing");
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::filesystem::remove(temp_path, ec);
                throw ServiceError(dropslot::ErrorCode::Internal, "Failed to write chunk " + std::to_string(index));
            }
        }

        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw ServiceError(dropslot::ErrorCode::Internal, "Failed to store chunk: " + ec.message());
        }
    }

    bool ChunkStore::exists(const std::string &session_id, std::uint64_t index) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(chunk_path(session_id, index), ec);
    }

    std::uint64_t ChunkStore::size(const std::string &session_id, std::uint64_t index) const
    {
        std::error_code ec;
        const auto value = std::filesystem::file_size(chunk_path(session_id, index), ec);
        if (ec)
        {
            throw ServiceError(dropslot::ErrorCode::NotFound, "Chunk " + std::to_string(index) + " is not stored");
        }
        return value;
    }

    std::ifstream ChunkStore::open(const std::string &session_id, std::uint64_t index) const
    {
        std::ifstream in(chunk_path(session_id, index), std::ios::binary);
        if (!in.is_open())
        {
            throw ServiceError(dropslot::ErrorCode::NotFound, "Chunk " + std::to_string(index) + " is not stored");
        }
        return in;
    }

    void ChunkStore::remove_all(const std::string &session_id) const
    {
        std::error_code ec;
        std::filesystem::remove_all(session_dir(session_id), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove chunks of upload {}: {}", session_id, ec.message());
        }
        std::filesystem::remove(assembly_path(session_id), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove assembly file of upload {}: {}", session_id, ec.message());
        }
    }

    std::vector<std::string> ChunkStore::stale_sessions(std::chrono::seconds max_age) const
    {
        std::vector<std::string> result;
        const auto now = std::filesystem::file_time_type::clock::now();
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(root_, ec))
        {
            std::error_code entry_ec;
            const auto modified = entry.last_write_time(entry_ec);
            if (entry_ec || now - modified <= max_age)
            {
                continue;
            }
            auto name = entry.path().filename().string();
            if (entry.is_regular_file(entry_ec) && entry.path().extension() == kAssemblySuffix)
            {
                name = entry.path().stem().string();
            }
            if (is_valid_session_id(name) && std::find(result.begin(), result.end(), name) == result.end())
            {
                result.push_back(std::move(name));
            }
        }
        if (ec)
        {
            spdlog::warn("Failed to scan chunk directory {}: {}", root_.string(), ec.message());
        }
        return result;
    }

} // namespace dropslot::server
