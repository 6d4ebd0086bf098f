#include "dropslot/server/keyed_locks.hpp"

#include <utility>

namespace dropslot::server
{

    KeyedLocks::Guard::Guard(KeyedLocks &owner, std::string key, std::shared_ptr<std::mutex> mutex)
        : owner_(owner), key_(std::move(key)), mutex_(std::move(mutex))
    {
        mutex_->lock();
    }

    KeyedLocks::Guard::~Guard()
    {
        mutex_->unlock();
        owner_.release(key_);
    }

    KeyedLocks::Guard KeyedLocks::acquire(const std::string &key)
    {
        std::shared_ptr<std::mutex> mutex;
        {
            std::lock_guard lock(mutex_);
            auto &entry = entries_[key];
            if (!entry.mutex)
            {
                entry.mutex = std::make_shared<std::mutex>();
            }
            ++entry.holders;
            mutex = entry.mutex;
        }
        // blocks outside the table lock so other keys stay available
        return Guard(*this, key, std::move(mutex));
    }

    std::size_t KeyedLocks::active_keys() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    void KeyedLocks::release(const std::string &key)
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
        {
            return;
        }
        if (--it->second.holders == 0)
        {
            entries_.erase(it);
        }
    }

} // namespace dropslot::server
