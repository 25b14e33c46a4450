#pragma once

#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <cstddef>
#include <deque>
#include <utility>

namespace homework {
namespace core {

// FIFO hand-off between two threads. push() blocks while the channel is full,
// pop() blocks while it is empty.
template <typename T>
class BoundedChannel
{
public:
    explicit BoundedChannel(std::size_t capacity)
        : m_capacity(capacity > 0 ? capacity : 1)
    {
    }

    BoundedChannel(const BoundedChannel &) = delete;
    BoundedChannel &operator=(const BoundedChannel &) = delete;

    void push(T value)
    {
        QMutexLocker locker(&m_mutex);
        while (m_items.size() >= m_capacity) {
            m_notFull.wait(&m_mutex);
        }
        m_items.push_back(std::move(value));
        m_notEmpty.wakeOne();
    }

    T pop()
    {
        QMutexLocker locker(&m_mutex);
        while (m_items.empty()) {
            m_notEmpty.wait(&m_mutex);
        }
        T value = std::move(m_items.front());
        m_items.pop_front();
        m_notFull.wakeOne();
        return value;
    }

    std::size_t size() const
    {
        QMutexLocker locker(&m_mutex);
        return m_items.size();
    }

    std::size_t capacity() const { return m_capacity; }

private:
    mutable QMutex m_mutex;
    QWaitCondition m_notEmpty;
    QWaitCondition m_notFull;
    std::deque<T> m_items;
    std::size_t m_capacity = 0;
};

} // namespace core
} // namespace homework
