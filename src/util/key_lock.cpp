#include "key_lock.hpp"

namespace util
{
    key_guard::key_guard(key_guard &&other) : owner(other.owner), key(std::move(other.key))
    {
        other.owner = NULL;
    }

    key_guard &key_guard::operator=(key_guard &&other)
    {
        if (this != &other)
        {
            release();
            owner = other.owner;
            key = std::move(other.key);
            other.owner = NULL;
        }
        return *this;
    }

    key_guard::~key_guard()
    {
        release();
    }

    bool key_guard::is_locked() const
    {
        return owner != NULL;
    }

    void key_guard::release()
    {
        if (owner)
        {
            owner->unref(key, true);
            owner = NULL;
            key.clear();
        }
    }

    /**
     * Acquires the mutex of the given key, waiting at most timeout_ms.
     * @param key Lock key.
     * @param timeout_ms Maximum time to wait for the key.
     * @param guard Guard which holds the key on success.
     * @return 0 when the key is held. -1 on timeout.
     */
    int key_lock::lock(const std::string &key, const uint64_t timeout_ms, key_guard &guard)
    {
        guard.release();

        lock_entry *entry;
        {
            std::scoped_lock lock(registry_mutex);
            std::unique_ptr<lock_entry> &ptr = entries[key];
            if (!ptr)
                ptr = std::make_unique<lock_entry>();
            ptr->ref_count++;
            entry = ptr.get();
        }

        // The entry cannot be erased while our reference is counted, so waiting outside the registry lock is safe.
        if (!entry->mutex.try_lock_for(std::chrono::milliseconds(timeout_ms)))
        {
            unref(key, false);
            return -1;
        }

        guard.owner = this;
        guard.key = key;
        return 0;
    }

    void key_lock::unref(const std::string &key, const bool unlock)
    {
        std::scoped_lock lock(registry_mutex);
        const auto itr = entries.find(key);
        if (itr == entries.end())
            return;

        if (unlock)
            itr->second->mutex.unlock();

        if (--itr->second->ref_count == 0)
            entries.erase(itr);
    }

    /**
     * Returns the number of keys currently held or waited on.
     */
    size_t key_lock::active_keys()
    {
        std::scoped_lock lock(registry_mutex);
        return entries.size();
    }

} // namespace util
