#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace VT100Lex::Terminal {

// Fixed-capacity blocking FIFO shared between threads.
// Any number of producers and consumers may use it concurrently; each item is
// handed to exactly one consumer. Close() wakes every waiter: producers get
// false, consumers get std::nullopt. Items still queued at Close() are not
// handed out.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : m_capacity(capacity > 0 ? capacity : 1)
    {
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while the queue is full
    bool Push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] { return m_closed || m_items.size() < m_capacity; });
        if (m_closed) {
            return false;
        }
        m_items.push_back(std::move(item));
        lock.unlock();
        m_notEmpty.notify_one();
        return true;
    }

    // Blocks while the queue is empty
    std::optional<T> Pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] { return m_closed || !m_items.empty(); });
        return TakeFront(lock);
    }

    // Waits at most `timeout` for an item
    template <typename Rep, typename Period>
    std::optional<T> PopFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_notEmpty.wait_for(lock, timeout, [this] { return m_closed || !m_items.empty(); })) {
            return std::nullopt;
        }
        return TakeFront(lock);
    }

    // Never blocks
    std::optional<T> TryPop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return TakeFront(lock);
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    void Clear() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_items.clear();
        }
        m_notFull.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t Capacity() const { return m_capacity; }

private:
    std::optional<T> TakeFront(std::unique_lock<std::mutex>& lock) {
        if (m_closed || m_items.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(m_items.front()));
        m_items.pop_front();
        lock.unlock();
        m_notFull.notify_one();
        return item;
    }

    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    std::deque<T> m_items;
    bool m_closed = false;
};

} // namespace VT100Lex::Terminal
