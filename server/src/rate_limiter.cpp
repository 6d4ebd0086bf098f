#include "dropslot/server/rate_limiter.hpp"

namespace dropslot::server
{

    namespace
    {
        constexpr std::size_t kPruneThreshold = 4096;
    }

    RateLimiter::RateLimiter(std::size_t limit, std::chrono::seconds window) : limit_(limit), window_(window)
    {
    }

    std::string RateLimiter::key_for(std::string_view action, std::string_view client)
    {
        std::string key;
        key.reserve(action.size() + client.size() + 1);
        key.append(action);
        key.push_back(':');
        key.append(client);
        return key;
    }

    bool RateLimiter::try_acquire(const std::string &key, std::chrono::steady_clock::time_point now)
    {
        if (limit_ == 0 || window_.count() <= 0)
        {
            return true;
        }
        std::lock_guard lock(mutex_);
        if (windows_.size() >= kPruneThreshold)
        {
            prune_locked(now);
        }
        auto &entry = windows_[key];
        if (entry.count == 0 || now - entry.started >= window_)
        {
            entry.started = now;
            entry.count = 0;
        }
        if (entry.count >= limit_)
        {
            return false;
        }
        ++entry.count;
        return true;
    }

    void RateLimiter::prune_locked(std::chrono::steady_clock::time_point now)
    {
        for (auto it = windows_.begin(); it != windows_.end();)
        {
            if (now - it->second.started >= window_)
            {
                it = windows_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

} // namespace dropslot::server
