#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropslot/crypto.hpp"
#include "dropslot/server/blob_store.hpp"
#include "dropslot/server/chunk_store.hpp"
#include "dropslot/server/config.hpp"
#include "dropslot/server/keyed_locks.hpp"
#include "dropslot/server/owner_scope.hpp"
#include "dropslot/server/rate_limiter.hpp"
#include "dropslot/server/service_error.hpp"
#include "dropslot/server/share_slot_manager.hpp"
#include "dropslot/server/upload_coordinator.hpp"
#include "dropslot/server/upload_session_registry.hpp"
#include "dropslot/server/user_store.hpp"

using namespace dropslot;
using namespace dropslot::server;

namespace
{

    const std::string kAlphabet = "abcdefghijklmnopqrstuvwxyz";

    std::filesystem::path make_temp_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / ("dropslot_" + name + "_" + crypto::random_token(4));
        std::filesystem::create_directories(root);
        return root;
    }

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::vector<std::byte> bytes(const std::string &text)
    {
        std::vector<std::byte> result(text.size());
        std::transform(text.begin(), text.end(), result.begin(), [](char ch)
                       { return static_cast<std::byte>(ch); });
        return result;
    }

    std::string read_stream(std::istream &in)
    {
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return read_stream(in);
    }

    template <typename Fn>
    ErrorCode service_error_code(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const ServiceError &error)
        {
            return error.code();
        }
        return ErrorCode::Ok;
    }

    // Moves the "updated_at" stamp of a persisted JSON row into the past.
    void age_row(const std::filesystem::path &row, std::chrono::hours age)
    {
        nlohmann::json json;
        {
            std::ifstream in(row);
            in >> json;
        }
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
        json["updated_at"] = now - std::chrono::duration_cast<std::chrono::seconds>(age).count();
        std::ofstream out(row, std::ios::trunc);
        out << json.dump();
    }

    void age_path(const std::filesystem::path &path, std::chrono::hours age)
    {
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
    }

    // The upload core wired the way the server wires it, below a test root.
    struct Core
    {
        explicit Core(const std::filesystem::path &root_dir, UploadLimits limits = {}, SlotPolicy policy = {})
            : root(root_dir),
              blobs(root / "blobs"),
              chunks(root / ".dropslot" / "chunks"),
              registry(root / ".dropslot"),
              slots(root / ".dropslot", blobs, policy),
              uploads(registry, chunks, slots, limits)
        {
        }

        std::filesystem::path row(const std::string &upload_id) const
        {
            return root / ".dropslot" / "uploads" / (upload_id + ".json");
        }

        std::filesystem::path root;
        BlobStore blobs;
        ChunkStore chunks;
        UploadSessionRegistry registry;
        ShareSlotManager slots;
        UploadCoordinator uploads;
    };

    StartRequest alphabet_start(const OwnerScope &scope, std::int64_t chunk_size = 10,
                                std::optional<std::string> upload_id = std::nullopt)
    {
        return StartRequest{
            .scope = scope,
            .filename = "alphabet.txt",
            .content_type = "text/plain",
            .total_size = static_cast<std::int64_t>(kAlphabet.size()),
            .chunk_size = chunk_size,
            .upload_id = std::move(upload_id),
        };
    }

    std::vector<std::byte> alphabet_chunk(std::uint64_t index, std::uint64_t chunk_size = 10)
    {
        return bytes(kAlphabet.substr(static_cast<std::size_t>(index * chunk_size), static_cast<std::size_t>(chunk_size)));
    }

    void test_compute_total_chunks()
    {
        assert(UploadCoordinator::compute_total_chunks(26, 10) == 3);
        assert(UploadCoordinator::compute_total_chunks(10, 10) == 1);
        assert(UploadCoordinator::compute_total_chunks(11, 10) == 2);
        assert(UploadCoordinator::compute_total_chunks(1, 10) == 1);
        assert(UploadCoordinator::compute_total_chunks(0, 10) == 1);
    }

    void test_owner_scope()
    {
        const auto anonymous = OwnerScope::public_scope();
        const auto alice = OwnerScope::user("alice");
        assert(anonymous == OwnerScope{});
        assert(anonymous.storage_key() == "public");
        assert(alice.storage_key() == "user-616c696365");
        assert(alice != OwnerScope::user("bob"));
        assert(alice != anonymous);

        const nlohmann::json json = alice;
        assert(json.get<OwnerScope>() == alice);
        const nlohmann::json public_json = anonymous;
        assert(public_json.get<OwnerScope>().is_public());
    }

    void test_keyed_locks()
    {
        KeyedLocks locks;
        {
            auto first = locks.acquire("a");
            auto second = locks.acquire("b");
            assert(locks.active_keys() == 2);
        }
        assert(locks.active_keys() == 0);

        std::atomic<int> inside{0};
        std::atomic<bool> overlapped{false};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i)
        {
            threads.emplace_back([&]
                                 {
                for (int round = 0; round < 50; ++round)
                {
                    auto guard = locks.acquire("shared");
                    if (inside.fetch_add(1) != 0)
                    {
                        overlapped = true;
                    }
                    inside.fetch_sub(1);
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(!overlapped);
        assert(locks.active_keys() == 0);
    }

    void test_chunk_store()
    {
        const auto root = make_temp_root("chunks");
        ChunkStore store(root);
        const std::string session = "00ff";

        assert(ChunkStore::chunk_file_name(7) == "000007.part");
        assert(!store.exists(session, 0));

        store.put(session, 0, bytes("first"));
        assert(store.exists(session, 0));
        assert(store.size(session, 0) == 5);
        assert(store.chunk_path(session, 0) == root / session / "000000.part");

        store.put(session, 0, bytes("second!"));
        auto in = store.open(session, 0);
        assert(read_stream(in) == "second!");
        // no temporary files are left next to the chunk
        assert(std::distance(std::filesystem::directory_iterator(root / session), std::filesystem::directory_iterator{}) == 1);

        assert(service_error_code([&]
                                  { (void)store.open(session, 5); }) == ErrorCode::NotFound);
        assert(service_error_code([&]
                                  { store.put("../escape", 0, bytes("x")); }) == ErrorCode::BadRequest);

        assert(store.stale_sessions(std::chrono::hours{24}).empty());
        age_path(root / session, std::chrono::hours{48});
        const auto stale = store.stale_sessions(std::chrono::hours{24});
        assert(stale.size() == 1 && stale.front() == session);

        store.remove_all(session);
        assert(!std::filesystem::exists(root / session));
        // removing twice is harmless
        store.remove_all(session);

        cleanup_path(root);
    }

    void test_blob_store_sanitizing()
    {
        const auto root = make_temp_root("blobs");
        BlobStore blobs(root);

        assert(blobs.resolve("public/a.txt") == root / "public" / "a.txt");
        assert(blobs.resolve("/public/./a.txt") == root / "public" / "a.txt");
        assert(service_error_code([&]
                                  { (void)blobs.resolve("../outside"); }) == ErrorCode::BadRequest);
        assert(service_error_code([&]
                                  { (void)blobs.resolve("public/../../outside"); }) == ErrorCode::BadRequest);
        assert(service_error_code([&]
                                  { (void)blobs.resolve(""); }) == ErrorCode::BadRequest);

        blobs.save("public/a.txt", bytes("hello"));
        assert(blobs.exists("public/a.txt"));
        assert(blobs.size("public/a.txt") == 5);
        auto in = blobs.open("public/a.txt");
        assert(read_stream(in) == "hello");

        const auto source = root / "incoming.bin";
        {
            std::ofstream out(source, std::ios::binary);
            out << "adopted";
        }
        blobs.adopt("users/61/b.bin", source);
        assert(!std::filesystem::exists(source));
        assert(read_file(root / "users" / "61" / "b.bin") == "adopted");

        const bool removed = blobs.remove("public/a.txt");
        assert(removed);
        assert(!blobs.exists("public/a.txt"));
        assert(service_error_code([&]
                                  { (void)blobs.size("public/a.txt"); }) == ErrorCode::NotFound);

        cleanup_path(root);
    }

    void test_registry_lifecycle()
    {
        const auto root = make_temp_root("registry");
        const auto alice = OwnerScope::user("alice");
        std::string id;
        {
            UploadSessionRegistry registry(root);
            const auto created = registry.create(alice, "notes.txt", "text/plain", 26, 10, 3);
            id = created.id;
            assert(id.size() == 32);
            assert(created.received_chunks.empty());
            assert(created.missing_chunks() == std::vector<std::uint64_t>({0, 1, 2}));
            assert(std::filesystem::exists(root / "uploads" / (id + ".json")));

            const auto first = registry.record_chunk(id, 2);
            assert(first.received_chunks.size() == 1);
            const auto again = registry.record_chunk(id, 2);
            assert(again.received_chunks.size() == 1);
            assert(service_error_code([&]
                                      { (void)registry.record_chunk(id, 3); }) == ErrorCode::BadRequest);
            assert(service_error_code([&]
                                      { (void)registry.record_chunk("ffff", 0); }) == ErrorCode::NotFound);

            assert(!registry.find_reusable(alice, "notes.txt", 26, 10, std::nullopt));
            assert(registry.find_reusable(alice, "notes.txt", 26, 10, id));
            assert(!registry.find_reusable(alice, "notes.txt", 26, 5, id));
            assert(!registry.find_reusable(alice, "other.txt", 26, 10, id));
            assert(!registry.find_reusable(alice, "notes.txt", 27, 10, id));
            assert(!registry.find_reusable(OwnerScope::user("bob"), "notes.txt", 26, 10, id));
            assert(!registry.find_reusable(OwnerScope::public_scope(), "notes.txt", 26, 10, id));
        }

        {
            // a restarted registry sees the persisted progress
            UploadSessionRegistry registry(root);
            assert(registry.size() == 1);
            const auto loaded = registry.find(id);
            assert(loaded.has_value());
            assert(loaded->scope == alice);
            assert(loaded->received_chunks == std::set<std::uint64_t>({2}));
            assert(loaded->missing_chunks() == std::vector<std::uint64_t>({0, 1}));

            const auto reconciled = registry.reconcile_on_resume(id, 2);
            assert(reconciled.total_chunks == 2);
            assert(reconciled.received_chunks.empty());

            registry.remove(id);
            assert(!registry.find(id));
            assert(!std::filesystem::exists(root / "uploads" / (id + ".json")));
        }

        {
            std::ofstream garbage(root / "uploads" / "broken.json");
            garbage << "{not json";
        }
        UploadSessionRegistry tolerant(root);
        assert(tolerant.size() == 0);

        cleanup_path(root);
    }

    void test_registry_expiry()
    {
        const auto root = make_temp_root("registry_expiry");
        std::string stale_id;
        std::string fresh_id;
        {
            UploadSessionRegistry registry(root);
            stale_id = registry.create(OwnerScope::public_scope(), "old.bin", "", 5, 5, 1).id;
            fresh_id = registry.create(OwnerScope::public_scope(), "new.bin", "", 5, 5, 1).id;
        }
        age_row(root / "uploads" / (stale_id + ".json"), std::chrono::hours{48});

        UploadSessionRegistry registry(root);
        const auto listed = registry.list_expired(std::chrono::hours{24});
        assert(listed.size() == 1 && listed.front().id == stale_id);
        assert(registry.list_expired(std::chrono::seconds{0}).empty());

        const auto removed = registry.delete_expired(std::chrono::hours{24});
        assert(removed.size() == 1 && removed.front().id == stale_id);
        assert(!registry.find(stale_id));
        assert(registry.find(fresh_id));
        assert(!std::filesystem::exists(root / "uploads" / (stale_id + ".json")));

        cleanup_path(root);
    }

    void test_upload_start_and_resume()
    {
        const auto root = make_temp_root("start");
        Core core(root);
        const auto scope = OwnerScope::public_scope();

        const auto started = core.uploads.start(alphabet_start(scope));
        assert(started.total_chunks == 3);
        assert(started.chunk_size == 10);
        assert(started.received_chunks.empty());
        assert(!started.resumed);

        core.uploads.put_chunk(scope, started.upload_id, 2, alphabet_chunk(2));
        core.uploads.put_chunk(scope, started.upload_id, 0, alphabet_chunk(0));

        const auto resumed = core.uploads.start(alphabet_start(scope, 10, started.upload_id));
        assert(resumed.resumed);
        assert(resumed.upload_id == started.upload_id);
        assert(resumed.received_chunks == std::vector<std::uint64_t>({0, 2}));

        // a different chunk size cannot reuse the stored chunks
        const auto fresh = core.uploads.start(alphabet_start(scope, 5, started.upload_id));
        assert(!fresh.resumed);
        assert(fresh.upload_id != started.upload_id);
        assert(fresh.total_chunks == 6);
        assert(fresh.received_chunks.empty());

        // without an id nothing is reused
        const auto anonymous = core.uploads.start(alphabet_start(scope));
        assert(!anonymous.resumed);
        assert(anonymous.upload_id != started.upload_id);

        // another owner never resumes a foreign session
        const auto foreign = core.uploads.start(alphabet_start(OwnerScope::user("mallory"), 10, started.upload_id));
        assert(!foreign.resumed);

        const auto defaulted = core.uploads.start(alphabet_start(scope, 0));
        assert(defaulted.chunk_size == UploadLimits{}.default_chunk_size);
        assert(defaulted.total_chunks == 1);

        cleanup_path(root);
    }

    void test_upload_start_validation()
    {
        const auto root = make_temp_root("validation");
        UploadLimits limits{};
        limits.public_max_bytes = 20;
        limits.user_max_bytes = 100;
        limits.max_chunk_size = 16;
        Core core(root, limits);
        const auto scope = OwnerScope::public_scope();

        auto blank = alphabet_start(scope);
        blank.filename = "   ";
        assert(service_error_code([&]
                                  { (void)core.uploads.start(blank); }) == ErrorCode::BadRequest);

        auto empty = alphabet_start(scope);
        empty.total_size = 0;
        assert(service_error_code([&]
                                  { (void)core.uploads.start(empty); }) == ErrorCode::BadRequest);

        auto negative = alphabet_start(scope);
        negative.total_size = -5;
        assert(service_error_code([&]
                                  { (void)core.uploads.start(negative); }) == ErrorCode::BadRequest);

        auto oversized_chunk = alphabet_start(OwnerScope::user("alice"), 17);
        assert(service_error_code([&]
                                  { (void)core.uploads.start(oversized_chunk); }) == ErrorCode::BadRequest);

        assert(service_error_code([&]
                                  { (void)core.uploads.start(alphabet_start(scope)); }) == ErrorCode::PayloadTooLarge);
        assert(service_error_code([&]
                                  { (void)core.uploads.start(alphabet_start(OwnerScope::user("alice"))); }) ==
               ErrorCode::Ok);

        auto padded = alphabet_start(OwnerScope::user("alice"));
        padded.filename = "  alphabet.txt \n";
        const auto started = core.uploads.start(padded);
        assert(core.registry.find(started.upload_id)->filename == "alphabet.txt");

        // rejected requests leave nothing behind
        assert(core.registry.size() == 2);

        cleanup_path(root);
    }

    void test_put_chunk_validation()
    {
        const auto root = make_temp_root("put_chunk");
        Core core(root);
        const auto scope = OwnerScope::user("alice");
        const auto started = core.uploads.start(alphabet_start(scope));
        const auto &id = started.upload_id;

        assert(service_error_code([&]
                                  { (void)core.uploads.put_chunk(scope, "abcdef", 0, alphabet_chunk(0)); }) ==
               ErrorCode::NotFound);
        assert(service_error_code([&]
                                  { (void)core.uploads.put_chunk(OwnerScope::public_scope(), id, 0, alphabet_chunk(0)); }) ==
               ErrorCode::Forbidden);
        assert(service_error_code([&]
                                  { (void)core.uploads.put_chunk(scope, id, -1, alphabet_chunk(0)); }) ==
               ErrorCode::BadRequest);
        assert(service_error_code([&]
                                  { (void)core.uploads.put_chunk(scope, id, 3, alphabet_chunk(0)); }) ==
               ErrorCode::BadRequest);
        assert(service_error_code([&]
                                  { (void)core.uploads.put_chunk(scope, id, 0, bytes("eleven byte")); }) ==
               ErrorCode::PayloadTooLarge);
        assert(!core.chunks.exists(id, 0));

        const auto first = core.uploads.put_chunk(scope, id, 0, alphabet_chunk(0));
        assert(first.received_count == 1 && first.total_chunks == 3);
        const auto repeated = core.uploads.put_chunk(scope, id, 0, alphabet_chunk(0));
        assert(repeated.received_count == 1);

        cleanup_path(root);
    }

    void test_upload_complete_publishes_file()
    {
        const auto root = make_temp_root("complete");
        Core core(root);
        const auto scope = OwnerScope::public_scope();

        const auto started = core.uploads.start(alphabet_start(scope));
        core.uploads.put_chunk(scope, started.upload_id, 2, alphabet_chunk(2));
        core.uploads.put_chunk(scope, started.upload_id, 0, alphabet_chunk(0));
        const auto resumed = core.uploads.start(alphabet_start(scope, 10, started.upload_id));
        assert(resumed.received_chunks == std::vector<std::uint64_t>({0, 2}));
        core.uploads.put_chunk(scope, started.upload_id, 1, alphabet_chunk(1));

        const auto result = core.uploads.complete(scope, started.upload_id);
        assert(result.name == "alphabet.txt");
        assert(result.size == 26);
        std::istringstream expected(kAlphabet);
        assert(result.content_hash == crypto::hash_stream(expected));

        auto opened = core.slots.open_file(scope);
        assert(opened.artifact.kind == ArtifactKind::File);
        assert(opened.artifact.name == "alphabet.txt");
        assert(read_stream(opened.stream) == kAlphabet);

        assert(!core.registry.find(started.upload_id));
        assert(!std::filesystem::exists(core.chunks.session_dir(started.upload_id)));
        assert(!std::filesystem::exists(core.chunks.assembly_path(started.upload_id)));
        assert(!std::filesystem::exists(core.row(started.upload_id)));

        // the session is gone once it finished
        assert(service_error_code([&]
                                  { (void)core.uploads.complete(scope, started.upload_id); }) == ErrorCode::NotFound);

        cleanup_path(root);
    }

    void test_upload_complete_in_any_order()
    {
        const auto root = make_temp_root("order");
        Core core(root);
        const auto scope = OwnerScope::user("alice");

        const auto started = core.uploads.start(alphabet_start(scope, 4));
        assert(started.total_chunks == 7);
        for (const std::uint64_t index : {6, 3, 0, 5, 1, 4, 2})
        {
            core.uploads.put_chunk(scope, started.upload_id, static_cast<std::int64_t>(index), alphabet_chunk(index, 4));
        }
        const auto result = core.uploads.complete(scope, started.upload_id);
        assert(result.size == 26);
        auto opened = core.slots.open_file(scope);
        assert(read_stream(opened.stream) == kAlphabet);
        assert(core.slots.read(OwnerScope::public_scope()).kind == ArtifactKind::None);

        cleanup_path(root);
    }

    void test_upload_complete_reports_missing_chunks()
    {
        const auto root = make_temp_root("missing");
        Core core(root);
        const auto scope = OwnerScope::public_scope();

        const auto started = core.uploads.start(alphabet_start(scope));
        core.uploads.put_chunk(scope, started.upload_id, 0, alphabet_chunk(0));

        std::vector<std::uint64_t> missing;
        ErrorCode code = ErrorCode::Ok;
        try
        {
            (void)core.uploads.complete(scope, started.upload_id);
        }
        catch (const ServiceError &error)
        {
            code = error.code();
            missing = error.missing_chunks();
        }
        assert(code == ErrorCode::Conflict);
        assert(missing == std::vector<std::uint64_t>({1, 2}));
        assert(core.registry.find(started.upload_id));
        assert(core.chunks.exists(started.upload_id, 0));
        assert(core.slots.read(scope).kind == ArtifactKind::None);

        assert(service_error_code([&]
                                  { (void)core.uploads.complete(OwnerScope::user("bob"), started.upload_id); }) ==
               ErrorCode::Forbidden);

        // chunks recorded but lost on disk are reported as missing as well
        core.uploads.put_chunk(scope, started.upload_id, 1, alphabet_chunk(1));
        core.uploads.put_chunk(scope, started.upload_id, 2, alphabet_chunk(2));
        std::filesystem::remove(core.chunks.chunk_path(started.upload_id, 1));
        missing.clear();
        code = ErrorCode::Ok;
        try
        {
            (void)core.uploads.complete(scope, started.upload_id);
        }
        catch (const ServiceError &error)
        {
            code = error.code();
            missing = error.missing_chunks();
        }
        assert(code == ErrorCode::Conflict);
        assert(missing == std::vector<std::uint64_t>({1}));

        core.uploads.put_chunk(scope, started.upload_id, 1, alphabet_chunk(1));
        const auto result = core.uploads.complete(scope, started.upload_id);
        assert(result.size == 26);

        cleanup_path(root);
    }

    void test_upload_complete_size_mismatch()
    {
        const auto root = make_temp_root("size_mismatch");
        Core core(root);
        const auto scope = OwnerScope::public_scope();

        const auto started = core.uploads.start(alphabet_start(scope));
        core.uploads.put_chunk(scope, started.upload_id, 0, bytes("short"));
        core.uploads.put_chunk(scope, started.upload_id, 1, alphabet_chunk(1));
        core.uploads.put_chunk(scope, started.upload_id, 2, alphabet_chunk(2));

        assert(service_error_code([&]
                                  { (void)core.uploads.complete(scope, started.upload_id); }) == ErrorCode::Conflict);
        assert(!std::filesystem::exists(core.chunks.assembly_path(started.upload_id)));
        assert(core.registry.find(started.upload_id));
        assert(core.slots.read(scope).kind == ArtifactKind::None);

        // overwriting the bad chunk repairs the upload
        core.uploads.put_chunk(scope, started.upload_id, 0, alphabet_chunk(0));
        const auto result = core.uploads.complete(scope, started.upload_id);
        assert(result.size == 26);

        cleanup_path(root);
    }

    void test_concurrent_chunks_and_single_flight_complete()
    {
        const auto root = make_temp_root("concurrency");
        Core core(root);
        const auto scope = OwnerScope::public_scope();
        const auto started = core.uploads.start(alphabet_start(scope, 2));
        assert(started.total_chunks == 13);

        std::vector<std::thread> writers;
        for (std::uint64_t index = 0; index < started.total_chunks; ++index)
        {
            writers.emplace_back([&, index]
                                 { core.uploads.put_chunk(scope, started.upload_id, static_cast<std::int64_t>(index),
                                                          alphabet_chunk(index, 2)); });
        }
        for (auto &writer : writers)
        {
            writer.join();
        }
        assert(core.registry.find(started.upload_id)->received_chunks.size() == 13);

        // retries of one index racing each other all succeed and leave a whole chunk behind
        std::atomic<int> failed_retries{0};
        std::vector<std::thread> retries;
        for (int i = 0; i < 4; ++i)
        {
            retries.emplace_back([&]
                                 {
                for (int round = 0; round < 25; ++round)
                {
                    try
                    {
                        core.uploads.put_chunk(scope, started.upload_id, 5, alphabet_chunk(5, 2));
                    }
                    catch (const std::exception &)
                    {
                        ++failed_retries;
                    }
                } });
        }
        for (auto &retry : retries)
        {
            retry.join();
        }
        assert(failed_retries == 0);
        assert(read_file(core.chunks.chunk_path(started.upload_id, 5)) == "kl");
        assert(std::distance(std::filesystem::directory_iterator(core.chunks.session_dir(started.upload_id)),
                             std::filesystem::directory_iterator{}) == 13);
        assert(core.registry.find(started.upload_id)->received_chunks.size() == 13);

        std::atomic<int> succeeded{0};
        std::atomic<int> not_found{0};
        std::vector<std::thread> completers;
        for (int i = 0; i < 2; ++i)
        {
            completers.emplace_back([&]
                                    {
                try
                {
                    (void)core.uploads.complete(scope, started.upload_id);
                    ++succeeded;
                }
                catch (const ServiceError &error)
                {
                    if (error.code() == ErrorCode::NotFound)
                    {
                        ++not_found;
                    }
                } });
        }
        for (auto &completer : completers)
        {
            completer.join();
        }
        assert(succeeded == 1);
        assert(not_found == 1);
        auto opened = core.slots.open_file(scope);
        assert(read_stream(opened.stream) == kAlphabet);

        cleanup_path(root);
    }

    void test_upload_complete_survives_failed_delivery()
    {
        const auto root = make_temp_root("delivery");
        Core core(root);
        const auto scope = OwnerScope::public_scope();

        const auto started = core.uploads.start(alphabet_start(scope));
        for (std::uint64_t index = 0; index < started.total_chunks; ++index)
        {
            core.uploads.put_chunk(scope, started.upload_id, static_cast<std::int64_t>(index), alphabet_chunk(index));
        }

        // a plain file where the public blob directory belongs makes publishing fail
        const auto blocker = root / "blobs" / "public";
        {
            std::ofstream out(blocker);
            out << "in the way";
        }

        bool threw = false;
        try
        {
            (void)core.uploads.complete(scope, started.upload_id);
        }
        catch (const std::exception &)
        {
            threw = true;
        }
        assert(threw);
        assert(!std::filesystem::exists(core.chunks.assembly_path(started.upload_id)));
        assert(core.registry.find(started.upload_id));
        assert(std::filesystem::exists(core.row(started.upload_id)));
        for (std::uint64_t index = 0; index < started.total_chunks; ++index)
        {
            assert(core.chunks.exists(started.upload_id, index));
        }
        assert(core.slots.read(scope).kind == ArtifactKind::None);

        // once the obstacle is gone the same upload completes
        std::filesystem::remove(blocker);
        const auto result = core.uploads.complete(scope, started.upload_id);
        assert(result.size == 26);
        auto opened = core.slots.open_file(scope);
        assert(read_stream(opened.stream) == kAlphabet);

        cleanup_path(root);
    }

    void test_failed_publish_leaves_no_blob()
    {
        const auto root = make_temp_root("orphan_blob");
        Core core(root);
        const auto scope = OwnerScope::public_scope();

        // an empty directory is moved into place but has no file size
        const auto source = root / "not_a_file";
        std::filesystem::create_directories(source);

        assert(service_error_code([&]
                                  { (void)core.slots.set_file(scope, source, "broken.bin"); }) == ErrorCode::NotFound);
        assert(core.slots.read(scope).kind == ArtifactKind::None);
        assert(std::filesystem::is_empty(root / "blobs" / "public"));

        cleanup_path(root);
    }

    void test_expired_sessions_are_swept()
    {
        const auto root = make_temp_root("sweep");
        const auto scope = OwnerScope::public_scope();
        std::string id;
        {
            Core core(root);
            id = core.uploads.start(alphabet_start(scope)).upload_id;
            core.uploads.put_chunk(scope, id, 0, alphabet_chunk(0));
            // chunks nobody owns any more
            core.chunks.put("deadbeef", 0, bytes("orphan"));
            age_row(core.row(id), std::chrono::hours{48});
            age_path(core.chunks.session_dir("deadbeef"), std::chrono::hours{48});
        }

        Core core(root);
        assert(core.registry.find(id));
        const auto reclaimed = core.uploads.sweep_expired();
        assert(reclaimed == 2);
        assert(!core.registry.find(id));
        assert(!std::filesystem::exists(core.chunks.session_dir(id)));
        assert(!std::filesystem::exists(core.chunks.session_dir("deadbeef")));
        assert(service_error_code([&]
                                  { (void)core.uploads.put_chunk(scope, id, 1, alphabet_chunk(1)); }) ==
               ErrorCode::NotFound);
        assert(core.uploads.sweep_expired() == 0);

        cleanup_path(root);
    }

    void test_expired_session_is_not_resumed()
    {
        const auto root = make_temp_root("expired_resume");
        const auto scope = OwnerScope::public_scope();
        std::string id;
        {
            Core core(root);
            id = core.uploads.start(alphabet_start(scope)).upload_id;
            core.uploads.put_chunk(scope, id, 0, alphabet_chunk(0));
            age_row(core.row(id), std::chrono::hours{48});
        }

        Core core(root);
        const auto restarted = core.uploads.start(alphabet_start(scope, 10, id));
        assert(!restarted.resumed);
        assert(restarted.upload_id != id);
        assert(restarted.received_chunks.empty());
        assert(!core.registry.find(id));

        cleanup_path(root);
    }

    void test_disabled_session_expiry()
    {
        const auto root = make_temp_root("no_expiry");
        UploadLimits limits{};
        limits.session_ttl = std::chrono::seconds{0};
        const auto scope = OwnerScope::public_scope();
        std::string id;
        {
            Core core(root, limits);
            id = core.uploads.start(alphabet_start(scope)).upload_id;
            age_row(core.row(id), std::chrono::hours{24 * 365});
        }

        Core core(root, limits);
        assert(core.uploads.sweep_expired() == 0);
        const auto resumed = core.uploads.start(alphabet_start(scope, 10, id));
        assert(resumed.resumed);

        cleanup_path(root);
    }

    void test_share_slot_replacement()
    {
        const auto root = make_temp_root("slots");
        Core core(root);
        const auto scope = OwnerScope::public_scope();

        const auto slot = core.slots.get_or_create(scope);
        assert(slot.scope == scope);
        assert(slot.artifact.kind == ArtifactKind::None);

        core.slots.set_text(scope, "hello");
        auto artifact = core.slots.read(scope);
        assert(artifact.kind == ArtifactKind::Text);
        assert(artifact.text == "hello");

        const auto first = core.slots.set_file_bytes(scope, "report.pdf", bytes("v1"));
        assert(first.kind == ArtifactKind::File);
        assert(first.name == "report.pdf");
        assert(first.size == 2);
        assert(first.text.empty());
        assert(first.blob_path.rfind("public/", 0) == 0);
        assert(core.blobs.exists(first.blob_path));

        const auto second = core.slots.set_file_bytes(scope, "report.pdf", bytes("version two"));
        assert(second.blob_path != first.blob_path);
        assert(!core.blobs.exists(first.blob_path));
        assert(core.blobs.exists(second.blob_path));

        core.slots.set_text(scope, "replaced");
        assert(!core.blobs.exists(second.blob_path));
        assert(core.slots.read(scope).kind == ArtifactKind::Text);
        assert(service_error_code([&]
                                  { (void)core.slots.open_file(scope); }) == ErrorCode::NotFound);

        const auto user_file = core.slots.set_file_bytes(OwnerScope::user("alice"), "../../etc/passwd", bytes("x"));
        assert(user_file.name == "passwd");
        assert(user_file.blob_path.rfind("users/616c696365/", 0) == 0);
        assert(core.slots.read(scope).text == "replaced");

        core.slots.clear(OwnerScope::user("alice"));
        assert(!core.blobs.exists(user_file.blob_path));
        assert(core.slots.read(OwnerScope::user("alice")).kind == ArtifactKind::None);

        cleanup_path(root);
    }

    void test_share_slot_persistence_and_expiry()
    {
        const auto root = make_temp_root("slot_expiry");
        const auto scope = OwnerScope::public_scope();
        const auto alice = OwnerScope::user("alice");
        std::string public_blob;
        {
            Core core(root);
            public_blob = core.slots.set_file_bytes(scope, "old.bin", bytes("old")).blob_path;
            core.slots.set_text(alice, "private note");
        }
        {
            // artifacts survive a restart
            Core core(root);
            assert(core.slots.read(scope).name == "old.bin");
            assert(core.slots.read(alice).text == "private note");
        }

        age_row(root / ".dropslot" / "slots" / "public.json", std::chrono::hours{48});
        age_row(root / ".dropslot" / "slots" / (alice.storage_key() + ".json"), std::chrono::hours{48});
        {
            Core core(root);
            assert(core.slots.read(scope).kind == ArtifactKind::None);
            assert(!core.blobs.exists(public_blob));
            // the user slot lives for thirty days
            assert(core.slots.read(alice).kind == ArtifactKind::Text);
        }

        age_row(root / ".dropslot" / "slots" / (alice.storage_key() + ".json"), std::chrono::hours{24 * 31});
        {
            Core core(root);
            assert(!core.slots.expire_if_stale(alice, std::chrono::seconds{0}));
            assert(core.slots.expire_if_stale(alice, core.slots.ttl_for(alice)));
            assert(core.slots.read(alice).kind == ArtifactKind::None);
        }

        cleanup_path(root);
    }

    void test_rate_limiter()
    {
        RateLimiter limiter(3, std::chrono::seconds{10});
        const auto start = std::chrono::steady_clock::now();
        assert(limiter.try_acquire("10.0.0.1", start));
        assert(limiter.try_acquire("10.0.0.1", start));
        assert(limiter.try_acquire("10.0.0.1", start + std::chrono::seconds{1}));
        assert(!limiter.try_acquire("10.0.0.1", start + std::chrono::seconds{2}));
        assert(limiter.try_acquire("10.0.0.2", start + std::chrono::seconds{2}));
        assert(limiter.try_acquire("10.0.0.1", start + std::chrono::seconds{11}));

        // each action from one address counts against its own window
        RateLimiter per_action(1, std::chrono::seconds{10});
        assert(RateLimiter::key_for("SHARE_PUT", "10.0.0.1") == "SHARE_PUT:10.0.0.1");
        assert(per_action.try_acquire(RateLimiter::key_for("SHARE_PUT", "10.0.0.1"), start));
        assert(!per_action.try_acquire(RateLimiter::key_for("SHARE_PUT", "10.0.0.1"), start));
        assert(per_action.try_acquire(RateLimiter::key_for("SHARE_CLEAR", "10.0.0.1"), start));
        assert(!per_action.try_acquire(RateLimiter::key_for("SHARE_CLEAR", "10.0.0.1"), start));

        RateLimiter disabled(0, std::chrono::seconds{10});
        for (int i = 0; i < 1000; ++i)
        {
            assert(disabled.try_acquire("anyone", start));
        }
    }

    void test_user_store()
    {
        const auto root = make_temp_root("users");
        {
            UserStore store(root);
            std::string message;
            const bool registered = store.register_user("alice", "secret", message);
            assert(registered);
            assert(message.empty());
            const bool duplicate = store.register_user("alice", "other", message);
            assert(!duplicate);
            assert(message == "User already exists");
            const bool invalid = store.register_user("../alice", "secret", message);
            assert(!invalid);
            assert(store.authenticate("alice", "secret"));
            assert(!store.authenticate("alice", "wrong"));
            assert(!store.authenticate("bob", "secret"));
        }
        UserStore reloaded(root);
        assert(reloaded.authenticate("alice", "secret"));
        assert(UserStore::is_valid_username("bob_1.x"));
        assert(!UserStore::is_valid_username(""));
        assert(!UserStore::is_valid_username("a b"));

        cleanup_path(root);
    }

    ServerConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "dropslot_server");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_server_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::invalid_argument &)
        {
            return true;
        }
        return false;
    }

    void test_server_config()
    {
        const auto defaults = parse({"--port", "9000", "--root", "/srv/dropslot"});
        assert(defaults.port == 9000);
        assert(defaults.root == std::filesystem::path("/srv/dropslot"));
        assert(defaults.address == "0.0.0.0");
        assert(defaults.uploads.public_max_bytes == 10ULL * 1024 * 1024);
        assert(defaults.uploads.default_chunk_size == 1024 * 1024);
        assert(defaults.uploads.session_ttl == std::chrono::hours{24});
        assert(defaults.slots.user_ttl == std::chrono::hours{24 * 30});
        assert(defaults.public_rate_limit.limit == 100);
        assert(defaults.public_rate_limit.window == std::chrono::seconds{600});
        assert(defaults.sweep_interval == std::chrono::seconds{600});
        assert(!defaults.verbose);

        const auto custom = parse({"--port", "9001", "--root", "data", "--address", "127.0.0.1", "--threads", "4",
                                   "--public-max-upload", "2048", "--user-max-upload", "4096", "--chunk-size", "512",
                                   "--max-chunk-size", "1024", "--session-ttl", "60", "--public-ttl", "0",
                                   "--user-ttl", "120", "--sweep-interval", "30", "--public-rate-limit", "5",
                                   "--rate-window", "15", "--log", "server.log", "--verbose"});
        assert(custom.address == "127.0.0.1");
        assert(custom.worker_threads == 4);
        assert(custom.uploads.public_max_bytes == 2048);
        assert(custom.uploads.user_max_bytes == 4096);
        assert(custom.uploads.default_chunk_size == 512);
        assert(custom.uploads.max_chunk_size == 1024);
        assert(custom.uploads.session_ttl == std::chrono::seconds{60});
        assert(custom.slots.public_ttl == std::chrono::seconds{0});
        assert(custom.slots.user_ttl == std::chrono::seconds{120});
        assert(custom.sweep_interval == std::chrono::seconds{30});
        assert(custom.public_rate_limit.limit == 5);
        assert(custom.public_rate_limit.window == std::chrono::seconds{15});
        assert(custom.log_file == std::optional<std::filesystem::path>("server.log"));
        assert(custom.verbose);

        assert(parse({"--help"}).show_help);
        assert(parse_fails({"--root", "data"}));
        assert(parse_fails({"--port", "9000"}));
        assert(parse_fails({"--port", "70000", "--root", "data"}));
        assert(parse_fails({"--port", "abc", "--root", "data"}));
        assert(parse_fails({"--port", "9000", "--root", "data", "--session-ttl", "-1"}));
        assert(parse_fails({"--port", "9000", "--root", "data", "--bogus"}));
        assert(parse_fails({"--port", "9000", "--root"}));
        assert(parse_fails({"--port", "9000", "--root", "data", "--chunk-size", "4096", "--max-chunk-size", "1024"}));
    }

} // namespace

void run_server_component_tests()
{
    test_compute_total_chunks();
    test_owner_scope();
    test_keyed_locks();
    test_chunk_store();
    test_blob_store_sanitizing();
    test_registry_lifecycle();
    test_registry_expiry();
    test_upload_start_and_resume();
    test_upload_start_validation();
    test_put_chunk_validation();
    test_upload_complete_publishes_file();
    test_upload_complete_in_any_order();
    test_upload_complete_reports_missing_chunks();
    test_upload_complete_size_mismatch();
    test_upload_complete_survives_failed_delivery();
    test_failed_publish_leaves_no_blob();
    test_concurrent_chunks_and_single_flight_complete();
    test_expired_sessions_are_swept();
    test_expired_session_is_not_resumed();
    test_disabled_session_expiry();
    test_share_slot_replacement();
    test_share_slot_persistence_and_expiry();
    test_rate_limiter();
    test_user_store();
    test_server_config();
}
