#pragma once

#include <atomic>
#include <concepts>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace Keystone
{

// A map whose values are constructed at most once per key,
// on first request, even when several threads request the same key
// concurrently. Loaded values are never replaced or removed,
// so references returned by get_or_load remain valid for the
// lifetime of the map.
//
// If the factory throws, nothing is stored for the key and the
// exception propagates; a later request for the key invokes the
// factory again.
template<
    typename Key,
    typename Value,
    typename Hash = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class load_once_map
{
    struct slot
    {
        std::mutex mutex;
        std::atomic<bool> loaded = false;
        std::optional<Value> value;
    };

    mutable std::mutex m_mutex;
    std::unordered_map<Key, std::unique_ptr<slot>, Hash, KeyEqual> m_slots;

    slot& get_slot(
        const Key& key)
    {
        std::scoped_lock lock(m_mutex);
        auto& entry = m_slots[key];
        if (!entry)
        {
            entry = std::make_unique<slot>();
        }
        return *entry;
    }

public:
    load_once_map() = default;
    load_once_map(const load_once_map&) = delete;
    load_once_map& operator=(const load_once_map&) = delete;

    template<
        std::invocable<const Key&> Factory
    > const Value& get_or_load(
        const Key& key,
        Factory&& factory)
    {
        auto& loadSlot = get_slot(key);

        if (!loadSlot.loaded.load(std::memory_order_acquire))
        {
            std::scoped_lock lock(loadSlot.mutex);
            if (!loadSlot.loaded.load(std::memory_order_relaxed))
            {
                loadSlot.value.emplace(
                    std::invoke(std::forward<Factory>(factory), key));
                loadSlot.loaded.store(true, std::memory_order_release);
            }
        }

        return *loadSlot.value;
    }

    const Value* find(
        const Key& key) const
    {
        std::scoped_lock lock(m_mutex);
        auto entry = m_slots.find(key);
        if (entry == m_slots.end()
            || !entry->second->loaded.load(std::memory_order_acquire))
        {
            return nullptr;
        }
        return &*entry->second->value;
    }

    size_t size() const
    {
        std::scoped_lock lock(m_mutex);
        size_t loadedCount = 0;
        for (const auto& [key, loadSlot] : m_slots)
        {
            if (loadSlot->loaded.load(std::memory_order_acquire))
            {
                ++loadedCount;
            }
        }
        return loadedCount;
    }
};

}
