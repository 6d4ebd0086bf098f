#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dropslot::server
{

    /// Table of mutexes addressed by key. Entries exist only while somebody holds or waits
    /// for the key.
    class KeyedLocks
    {
    public:
        class Guard
        {
        public:
            Guard(KeyedLocks &owner, std::string key, std::shared_ptr<std::mutex> mutex);
            ~Guard();

            Guard(const Guard &) = delete;
            Guard &operator=(const Guard &) = delete;

        private:
            KeyedLocks &owner_;
            std::string key_;
            std::shared_ptr<std::mutex> mutex_;
        };

        Guard acquire(const std::string &key);

        std::size_t active_keys() const;

    private:
        void release(const std::string &key);

        struct Entry
        {
            std::shared_ptr<std::mutex> mutex;
            std::size_t holders{};
        };

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace dropslot::server
