#ifndef _UL_UTIL_KEY_LOCK_
#define _UL_UTIL_KEY_LOCK_

#include "../pchheader.hpp"

namespace util
{
    class key_lock;

    /**
     * Holds one key of a key_lock registry until destroyed or released.
     */
    class key_guard
    {
        friend class key_lock;

    private:
        key_lock *owner = NULL;
        std::string key;

    public:
        key_guard() = default;
        key_guard(const key_guard &) = delete;
        key_guard &operator=(const key_guard &) = delete;
        key_guard(key_guard &&other);
        key_guard &operator=(key_guard &&other);
        ~key_guard();

        bool is_locked() const;
        void release();
    };

    /**
     * Registry of mutexes keyed by string (eg. client id or settlement period key).
     * Callers holding different keys never wait on each other. Entries are removed when the
     * last holder or waiter of a key lets go, so the registry only grows with active keys.
     */
    class key_lock
    {
        friend class key_guard;

    private:
        struct lock_entry
        {
            std::timed_mutex mutex;
            size_t ref_count = 0; // Holders and waiters currently referencing this entry.
        };

        std::unordered_map<std::string, std::unique_ptr<lock_entry>> entries;
        std::mutex registry_mutex;

        void unref(const std::string &key, const bool unlock);

    public:
        int lock(const std::string &key, const uint64_t timeout_ms, key_guard &guard);
        size_t active_keys();
    };

} // namespace util

#endif
