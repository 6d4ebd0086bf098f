#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <thread>
#include <vector>

#include "dropslot/server/blob_store.hpp"
#include "dropslot/server/chunk_store.hpp"
#include "dropslot/server/config.hpp"
#include "dropslot/server/rate_limiter.hpp"
#include "dropslot/server/share_slot_manager.hpp"
#include "dropslot/server/upload_coordinator.hpp"
#include "dropslot/server/upload_session_registry.hpp"
#include "dropslot/server/user_store.hpp"

namespace dropslot::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_sweep();
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer sweep_timer_;

        BlobStore blobs_;
        ChunkStore chunks_;
        UploadSessionRegistry registry_;
        ShareSlotManager slots_;
        UploadCoordinator uploads_;
        UserStore user_store_;
        RateLimiter public_rate_limiter_;

        std::vector<std::thread> workers_;
    };

} // namespace dropslot::server
