#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dropslot::server
{

    /// Fixed-window request counter keyed by client. A limit of zero disables limiting.
    class RateLimiter
    {
    public:
        RateLimiter(std::size_t limit, std::chrono::seconds window);

        /// Separate budget per action, e.g. uploads and clears from one address do not share a window.
        static std::string key_for(std::string_view action, std::string_view client);

        bool try_acquire(const std::string &key,
                         std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    private:
        struct Window
        {
            std::chrono::steady_clock::time_point started;
            std::size_t count{};
        };

        void prune_locked(std::chrono::steady_clock::time_point now);

        std::size_t limit_;
        std::chrono::seconds window_;
        std::mutex mutex_;
        std::unordered_map<std::string, Window> windows_;
    };

} // namespace dropslot::server
