#include "dropslot/client/session.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <span>
#include <vector>

#include "dropslot/crypto.hpp"
#include "dropslot/encoding/base64.hpp"
#include "dropslot/error_codes.hpp"
#include "dropslot/protocol.hpp"

namespace dropslot::client
{

    namespace
    {
        constexpr std::uint64_t kDownloadChunk = 1ULL * 1024 * 1024;
        constexpr auto kContentType = "application/octet-stream";
    } // namespace

    bool ClientSession::handle_upload(const std::filesystem::path &local_path_input)
    {
        const auto absolute_local = std::filesystem::absolute(local_path_input);
        if (!std::filesystem::exists(absolute_local))
        {
            std::cout << "ERROR: file_not_found" << std::endl;
            std::cout << "Local file does not exist." << std::endl;
            return false;
        }
        if (!std::filesystem::is_regular_file(absolute_local))
        {
            std::cout << "ERROR: invalid_target" << std::endl;
            std::cout << "Local path is not a file." << std::endl;
            return false;
        }

        const auto file_size = std::filesystem::file_size(absolute_local);
        const auto key = state_key();
        const auto remembered = state_store_.find(key, absolute_local, file_size);

        dropslot::protocol::UploadStartRequest start{
            .filename = absolute_local.filename().string(),
            .content_type = kContentType,
            .total_size = static_cast<std::int64_t>(file_size),
            .chunk_size = static_cast<std::int64_t>(config_.chunk_size.value_or(0)),
            .upload_id = remembered ? std::optional<std::string>{remembered->upload_id} : std::nullopt,
        };
        auto start_response = rpc(dropslot::protocol::Command::UploadStart, start);
        if (start_response.kind == dropslot::protocol::ResponseKind::Error)
        {
            print_error(start_response);
            return false;
        }
        const auto session = start_response.payload.get<dropslot::protocol::UploadStartResponse>();
        state_store_.remember(key, absolute_local, file_size, session.upload_id);
        if (session.resumed)
        {
            std::cout << "Resuming upload (" << session.received_chunks.size() << " / " << session.total_chunks
                      << " chunks already on the server)" << std::endl;
        }

        std::ifstream input(absolute_local, std::ios::binary);
        if (!input.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Could not open local file for reading." << std::endl;
            return false;
        }

        const std::set<std::uint64_t> received(session.received_chunks.begin(), session.received_chunks.end());
        std::vector<std::uint64_t> pending;
        for (std::uint64_t index = 0; index < session.total_chunks; ++index)
        {
            if (!received.contains(index))
            {
                pending.push_back(index);
            }
        }
        if (!send_chunks(input, session.upload_id, session.chunk_size, file_size, pending))
        {
            return false;
        }

        dropslot::protocol::UploadCompleteRequest complete{.upload_id = session.upload_id};
        auto complete_response = rpc(dropslot::protocol::Command::UploadComplete, complete);
        if (complete_response.kind == dropslot::protocol::ResponseKind::Error &&
            complete_response.error == dropslot::ErrorCode::Conflict)
        {
            const auto missing =
                complete_response.payload.value("missing_chunks", std::vector<std::uint64_t>{});
            if (!missing.empty())
            {
                std::cout << "Server is missing " << missing.size() << " chunk(s), sending them again" << std::endl;
                logger_.warn("upload", "retrying ", missing.size(), " missing chunks of ", session.upload_id);
                if (!send_chunks(input, session.upload_id, session.chunk_size, file_size, missing))
                {
                    return false;
                }
                complete_response = rpc(dropslot::protocol::Command::UploadComplete, complete);
            }
        }
        if (complete_response.kind == dropslot::protocol::ResponseKind::Error)
        {
            if (complete_response.error == dropslot::ErrorCode::NotFound)
            {
                state_store_.forget(key, absolute_local, file_size);
            }
            print_error(complete_response);
            return false;
        }

        const auto result = complete_response.payload.get<dropslot::protocol::UploadCompleteResponse>();
        state_store_.forget(key, absolute_local, file_size);
        input.close();
        const auto local_hash = dropslot::crypto::hash_file(absolute_local);
        if (!result.content_hash.empty() && result.content_hash != local_hash)
        {
            std::cout << "ERROR: hash_mismatch" << std::endl;
            std::cout << "The server stored different content than the local file." << std::endl;
            return false;
        }
        std::cout << "OK" << std::endl;
        std::cout << "Shared " << result.name << " (" << result.size << " bytes)" << std::endl;
        return true;
    }

    bool ClientSession::send_chunks(std::ifstream &input, const std::string &upload_id, std::uint64_t chunk_size,
                                    std::uint64_t total_size, const std::vector<std::uint64_t> &indices)
    {
        std::vector<std::byte> buffer;
        std::size_t sent = 0;
        for (const auto index : indices)
        {
            const auto offset = index * chunk_size;
            if (offset >= total_size && total_size > 0)
            {
                continue;
            }
            const auto length = std::min<std::uint64_t>(chunk_size, total_size - offset);
            buffer.resize(static_cast<std::size_t>(length));
            input.clear();
            input.seekg(static_cast<std::streamoff>(offset));
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            if (static_cast<std::uint64_t>(input.gcount()) != length)
            {
                std::cout << std::endl;
                std::cout << "ERROR: file_io" << std::endl;
                std::cout << "Local file changed while uploading." << std::endl;
                return false;
            }

            dropslot::protocol::UploadChunkRequest chunk{
                .upload_id = upload_id,
                .index = static_cast<std::int64_t>(index),
                .data_base64 = dropslot::encoding::encode_base64(buffer),
            };
            auto chunk_response = rpc(dropslot::protocol::Command::UploadChunk, chunk);
            if (chunk_response.kind == dropslot::protocol::ResponseKind::Error)
            {
                std::cout << std::endl;
                print_error(chunk_response);
                return false;
            }
            ++sent;
            std::cout << "\rUploaded chunk " << sent << " / " << indices.size() << std::flush;
        }
        if (!indices.empty())
        {
            std::cout << std::endl;
        }
        return true;
    }

    bool ClientSession::handle_get(const std::filesystem::path &local_target)
    {
        if (std::filesystem::exists(local_target))
        {
            std::cout << "ERROR: file_exists" << std::endl;
            std::cout << "Local file already exists." << std::endl;
            return false;
        }

        auto info_response = rpc(dropslot::protocol::Command::ShareGet);
        if (info_response.kind == dropslot::protocol::ResponseKind::Error)
        {
            print_error(info_response);
            return false;
        }
        const auto info = info_response.payload.get<dropslot::protocol::ShareInfo>();
        if (info.kind != dropslot::protocol::ShareKind::File)
        {
            std::cout << "ERROR: not_found" << std::endl;
            std::cout << "No file is shared." << std::endl;
            return false;
        }

        auto part_path = local_target;
        part_path += ".part";
        std::ofstream output(part_path, std::ios::binary | std::ios::trunc);
        if (!output.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Failed to open partial file for writing." << std::endl;
            return false;
        }

        std::uint64_t offset = 0;
        bool done = info.size == 0;
        while (!done)
        {
            dropslot::protocol::ShareReadRequest request{.offset = offset, .max_bytes = kDownloadChunk};
            auto read_response = rpc(dropslot::protocol::Command::ShareRead, request);
            if (read_response.kind == dropslot::protocol::ResponseKind::Error)
            {
                std::cout << std::endl;
                print_error(read_response);
                output.close();
                std::error_code ec;
                std::filesystem::remove(part_path, ec);
                return false;
            }
            const auto block = read_response.payload.get<dropslot::protocol::ShareReadResponse>();
            const auto data = dropslot::encoding::decode_base64(block.data_base64);
            if (!data || data->size() != block.bytes || block.offset != offset)
            {
                std::cout << std::endl;
                std::cout << "ERROR: invalid_response" << std::endl;
                output.close();
                std::error_code ec;
                std::filesystem::remove(part_path, ec);
                return false;
            }
            output.write(reinterpret_cast<const char *>(data->data()), static_cast<std::streamsize>(data->size()));
            offset += block.bytes;
            done = block.done || block.bytes == 0;
            std::cout << "\rDownloaded " << offset << " / " << info.size << " bytes" << std::flush;
        }
        std::cout << std::endl;
        output.flush();
        if (!output)
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Failed to write to partial file." << std::endl;
            return false;
        }
        output.close();

        std::error_code ec;
        std::filesystem::rename(part_path, local_target, ec);
        if (ec)
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Failed to finalize downloaded file: " << ec.message() << std::endl;
            return false;
        }
        std::cout << "OK" << std::endl;
        std::cout << "Saved " << info.name << " to " << local_target.string() << std::endl;
        return true;
    }

} // namespace dropslot::client
