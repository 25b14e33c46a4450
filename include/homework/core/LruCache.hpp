#pragma once

#include <QHash>
#include <cstddef>
#include <list>
#include <optional>
#include <utility>

namespace homework {
namespace core {

// Fixed-capacity map that evicts the least recently used entry on overflow.
template <typename Key, typename Value>
class LruCache
{
public:
    explicit LruCache(std::size_t capacity = 1000)
        : m_capacity(capacity > 0 ? capacity : 1)
    {
    }

    std::optional<Value> find(const Key &key)
    {
        auto it = m_lookup.find(key);
        if (it == m_lookup.end()) {
            return std::nullopt;
        }
        m_entries.splice(m_entries.begin(), m_entries, it.value());
        return it.value()->second;
    }

    void insert(const Key &key, Value value)
    {
        auto it = m_lookup.find(key);
        if (it != m_lookup.end()) {
            it.value()->second = std::move(value);
            m_entries.splice(m_entries.begin(), m_entries, it.value());
            return;
        }
        if (m_entries.size() == m_capacity) {
            m_lookup.remove(m_entries.back().first);
            m_entries.pop_back();
        }
        m_entries.emplace_front(key, std::move(value));
        m_lookup.insert(key, m_entries.begin());
    }

    bool contains(const Key &key) const { return m_lookup.contains(key); }
    std::size_t size() const { return m_entries.size(); }
    std::size_t capacity() const { return m_capacity; }

    void clear()
    {
        m_entries.clear();
        m_lookup.clear();
    }

private:
    using Entry = std::pair<Key, Value>;

    std::list<Entry> m_entries;
    QHash<Key, typename std::list<Entry>::iterator> m_lookup;
    std::size_t m_capacity = 0;
};

} // namespace core
} // namespace homework
