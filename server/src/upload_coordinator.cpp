#include "dropslot/server/upload_coordinator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

#include "dropslot/crypto.hpp"
#include "dropslot/server/service_error.hpp"

namespace dropslot::server
{

    namespace
    {
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        std::string trim(const std::string &value)
        {
            const auto is_space = [](unsigned char ch)
            { return std::isspace(ch) != 0; };
            auto begin = std::find_if_not(value.begin(), value.end(), is_space);
            auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
            if (begin >= end)
            {
                return {};
            }
            return std::string(begin, end);
        }

        // Removes the temporary assembly file on every exit path. After a successful
        // hand-off the file has been moved away and the removal is a no-op.
        class AssemblyFile
        {
        public:
            explicit AssemblyFile(std::filesystem::path path) : path_(std::move(path)) {}

            ~AssemblyFile()
            {
                std::error_code ec;
                std::filesystem::remove(path_, ec);
                if (ec)
                {
                    spdlog::warn("Failed to remove assembly file {}: {}", path_.string(), ec.message());
                }
            }

            AssemblyFile(const AssemblyFile &) = delete;
            AssemblyFile &operator=(const AssemblyFile &) = delete;

            const std::filesystem::path &path() const noexcept { return path_; }

        private:
            std::filesystem::path path_;
        };

        void append_chunk(std::ofstream &out, std::ifstream &in, std::array<char, kCopyBufferSize> &buffer)
        {
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = in.gcount();
                if (count > 0)
                {
                    out.write(buffer.data(), count);
                }
            }
            if (in.bad())
            {
                throw ServiceError(dropslot::ErrorCode::Internal, "Failed to read chunk during assembly");
            }
        }

    } // namespace

    UploadCoordinator::UploadCoordinator(UploadSessionRegistry &registry, ChunkStore &chunks, ShareSlotManager &slots,
                                         UploadLimits limits)
        : registry_(registry), chunks_(chunks), slots_(slots), limits_(limits)
    {
    }

    std::uint64_t UploadCoordinator::compute_total_chunks(std::uint64_t total_size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        return std::max<std::uint64_t>(1, (total_size + chunk_size - 1) / chunk_size);
    }

    StartResult UploadCoordinator::start(const StartRequest &request)
    {
        const auto filename = trim(request.filename);
        if (filename.empty())
        {
            throw ServiceError(dropslot::ErrorCode::BadRequest, "Filename is required");
        }
        if (request.total_size <= 0)
        {
            throw ServiceError(dropslot::ErrorCode::BadRequest, "Upload size must be positive");
        }
        const auto total_size = static_cast<std::uint64_t>(request.total_size);
        const auto chunk_size = request.chunk_size <= 0 ? limits_.default_chunk_size
                                                        : static_cast<std::uint64_t>(request.chunk_size);
        if (chunk_size > limits_.max_chunk_size)
        {
            throw ServiceError(dropslot::ErrorCode::BadRequest,
                               "Chunk size exceeds " + std::to_string(limits_.max_chunk_size) + " bytes");
        }
        const auto max_bytes = request.scope.is_public() ? limits_.public_max_bytes : limits_.user_max_bytes;
        if (total_size > max_bytes)
        {
            throw ServiceError(dropslot::ErrorCode::PayloadTooLarge,
                               "Upload exceeds the limit of " + std::to_string(max_bytes) + " bytes");
        }

        try
        {
            sweep_expired();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Upload sweep failed: {}", ex.what());
        }

        const auto total_chunks = compute_total_chunks(total_size, chunk_size);

        auto existing = registry_.find_reusable(request.scope, filename, total_size, chunk_size, request.upload_id);
        if (existing && existing->is_expired(limits_.session_ttl, std::chrono::system_clock::now()))
        {
            existing.reset();
        }

        StartResult result{};
        if (existing)
        {
            auto session = registry_.reconcile_on_resume(existing->id, total_chunks);
            result.upload_id = session.id;
            result.received_chunks.assign(session.received_chunks.begin(), session.received_chunks.end());
            result.resumed = true;
            spdlog::info("Resumed upload {} of '{}' for {} ({}/{} chunks present)", session.id, filename,
                         request.scope.describe(), result.received_chunks.size(), total_chunks);
        }
        else
        {
            auto session = registry_.create(request.scope, filename, request.content_type, total_size, chunk_size,
                                            total_chunks);
            result.upload_id = session.id;
            spdlog::info("Started upload {} of '{}' ({} bytes, {} chunks) for {}", session.id, filename, total_size,
                         total_chunks, request.scope.describe());
        }
        result.chunk_size = chunk_size;
        result.total_chunks = total_chunks;
        return result;
    }

    ChunkReceipt UploadCoordinator::put_chunk(const OwnerScope &scope, const std::string &upload_id,
                                              std::int64_t index, std::span<const std::byte> data)
    {
        const auto session = require_owned(scope, upload_id);
        if (index < 0 || static_cast<std::uint64_t>(index) >= session.total_chunks)
        {
            throw ServiceError(dropslot::ErrorCode::BadRequest, "Chunk index " + std::to_string(index) +
                                                                    " outside [0, " +
                                                                    std::to_string(session.total_chunks) + ")");
        }
        const auto chunk_index = static_cast<std::uint64_t>(index);
        const bool is_final = chunk_index + 1 == session.total_chunks;
        if ((!is_final && data.size() > session.chunk_size) || data.size() > limits_.max_chunk_size)
        {
            throw ServiceError(dropslot::ErrorCode::PayloadTooLarge, "Chunk exceeds the chunk size");
        }

        chunks_.put(upload_id, chunk_index, data);

        UploadSession updated;
        try
        {
            updated = registry_.record_chunk(upload_id, chunk_index);
        }
        catch (const ServiceError &ex)
        {
            // the session vanished while the chunk was written; do not leave the bytes behind
            if (ex.code() == dropslot::ErrorCode::NotFound)
            {
                chunks_.remove_all(upload_id);
            }
            throw;
        }
        spdlog::debug("Upload {} received chunk {} ({} bytes)", upload_id, chunk_index, data.size());
        return ChunkReceipt{
            .received_count = updated.received_chunks.size(),
            .total_chunks = updated.total_chunks,
        };
    }

    CompletionResult UploadCoordinator::complete(const OwnerScope &scope, const std::string &upload_id)
    {
        auto guard = session_locks_.acquire(upload_id);
        const auto session = require_owned(scope, upload_id);

        auto missing = session.missing_chunks();
        if (!missing.empty())
        {
            throw ServiceError(dropslot::ErrorCode::Conflict,
                               "Upload is missing " + std::to_string(missing.size()) + " chunk(s)",
                               std::move(missing));
        }

        std::vector<std::uint64_t> absent;
        for (std::uint64_t index = 0; index < session.total_chunks; ++index)
        {
            if (!chunks_.exists(upload_id, index))
            {
                absent.push_back(index);
            }
        }
        if (!absent.empty())
        {
            spdlog::warn("Upload {} lost {} stored chunk(s)", upload_id, absent.size());
            throw ServiceError(dropslot::ErrorCode::Conflict, "Stored chunks are missing", std::move(absent));
        }

        AssemblyFile assembly(chunks_.assembly_path(upload_id));
        {
            std::ofstream out(assembly.path(), std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw ServiceError(dropslot::ErrorCode::Internal, "Cannot create assembly file");
            }
            std::array<char, kCopyBufferSize> buffer{};
            for (std::uint64_t index = 0; index < session.total_chunks; ++index)
            {
                auto in = chunks_.open(upload_id, index);
                append_chunk(out, in, buffer);
            }
            out.flush();
            if (!out)
            {
                throw ServiceError(dropslot::ErrorCode::Internal, "Failed to write assembly file");
            }
        }

        std::error_code ec;
        const auto assembled_size = std::filesystem::file_size(assembly.path(), ec);
        if (ec)
        {
            throw ServiceError(dropslot::ErrorCode::Internal, "Cannot stat assembly file: " + ec.message());
        }
        if (assembled_size != session.total_size)
        {
            throw ServiceError(dropslot::ErrorCode::Conflict, "Assembled size " + std::to_string(assembled_size) +
                                                                  " does not match declared size " +
                                                                  std::to_string(session.total_size));
        }

        const auto content_hash = crypto::hash_file(assembly.path());
        const auto artifact = slots_.set_file(scope, assembly.path(), session.filename);

        chunks_.remove_all(upload_id);
        registry_.remove(upload_id);
        spdlog::info("Completed upload {} as '{}' ({} bytes) for {}", upload_id, artifact.name, artifact.size,
                     scope.describe());

        return CompletionResult{
            .name = artifact.name,
            .size = artifact.size,
            .content_hash = content_hash,
        };
    }

    std::size_t UploadCoordinator::sweep_expired()
    {
        if (limits_.session_ttl.count() <= 0)
        {
            return 0;
        }

        std::size_t reclaimed = 0;
        for (const auto &session : registry_.delete_expired(limits_.session_ttl))
        {
            chunks_.remove_all(session.id);
            spdlog::info("Expired upload {} of '{}' for {}", session.id, session.filename, session.scope.describe());
            ++reclaimed;
        }

        for (const auto &orphan : chunks_.stale_sessions(limits_.session_ttl))
        {
            if (registry_.find(orphan))
            {
                continue;
            }
            chunks_.remove_all(orphan);
            spdlog::info("Removed orphaned chunks of upload {}", orphan);
            ++reclaimed;
        }
        return reclaimed;
    }

    UploadSession UploadCoordinator::require_owned(const OwnerScope &scope, const std::string &upload_id) const
    {
        auto session = registry_.find(upload_id);
        if (!session)
        {
            throw ServiceError(dropslot::ErrorCode::NotFound, "Unknown upload");
        }
        if (session->scope != scope)
        {
            throw ServiceError(dropslot::ErrorCode::Forbidden, "Upload belongs to another owner");
        }
        return *session;
    }

} // namespace dropslot::server
