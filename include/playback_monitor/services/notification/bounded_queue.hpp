#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace playback_monitor {
namespace services {

// FIFO with a fixed capacity. A push into a full queue evicts the oldest
// element instead of blocking the producer.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : m_capacity(capacity > 0 ? capacity : 1) {}

    // Returns how many elements this call dropped: evicted older ones, or
    // the value itself when the queue is closed
    std::size_t push(T value) {
        std::size_t dropped = 0;
        {
            std::lock_guard lock(m_mutex);
            if (m_closed) {
                m_dropped.fetch_add(1);
                return 1;
            }
            while (m_queue.size() >= m_capacity) {
                m_queue.pop_front();
                ++dropped;
            }
            m_queue.push_back(std::move(value));
            m_dropped.fetch_add(dropped);
        }
        m_available.notify_one();
        return dropped;
    }

    // Blocks until an element is available, the queue is closed and empty,
    // or stop is requested
    std::optional<T> pop(std::stop_token stop_token) {
        std::unique_lock lock(m_mutex);
        m_available.wait(lock, stop_token, [this] { return !m_queue.empty() || m_closed; });
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        return value;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        return value;
    }

    // Wakes consumers; further pushes are rejected
    void close() {
        {
            std::lock_guard lock(m_mutex);
            m_closed = true;
        }
        m_available.notify_all();
    }

    void reopen() {
        std::lock_guard lock(m_mutex);
        m_closed = false;
    }

    // Returns how many of the oldest elements were trimmed
    std::size_t set_capacity(std::size_t capacity) {
        std::lock_guard lock(m_mutex);
        m_capacity = capacity > 0 ? capacity : 1;
        std::size_t trimmed = 0;
        while (m_queue.size() > m_capacity) {
            m_queue.pop_front();
            ++trimmed;
        }
        m_dropped.fetch_add(trimmed);
        return trimmed;
    }

    std::size_t size() const {
        std::lock_guard lock(m_mutex);
        return m_queue.size();
    }

    bool empty() const { return size() == 0; }

    std::size_t capacity() const {
        std::lock_guard lock(m_mutex);
        return m_capacity;
    }

    std::uint64_t dropped() const { return m_dropped.load(); }

private:
    mutable std::mutex m_mutex;
    std::condition_variable_any m_available;
    std::deque<T> m_queue;
    std::size_t m_capacity;
    bool m_closed = false;
    std::atomic<std::uint64_t> m_dropped{0};
};

} // namespace services
} // namespace playback_monitor
