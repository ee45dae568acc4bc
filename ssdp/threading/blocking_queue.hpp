#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace ssdp
{

/**
 * @brief FIFO handing items from one producer thread to any number of consumer threads.
 *
 * Consumers wait with a timeout so they can observe a shutdown flag between waits.
 */
template <typename T>
class BlockingQueue
{
public:
    BlockingQueue() = default;

    BlockingQueue(const BlockingQueue&)            = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    void push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _items.push_back(std::move(item));
        }
        _not_empty.notify_one();
    }

    /**
     * @brief Pop the oldest item, waiting at most @p timeout for one to arrive.
     * @return The item, or std::nullopt if the queue stayed empty.
     */
    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout)
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_not_empty.wait_for(lock, timeout, [this]() { return !_items.empty(); }))
        {
            return std::nullopt;
        }

        T item = std::move(_items.front());
        _items.pop_front();
        return item;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _not_empty;
    std::deque<T> _items;
};

} // namespace ssdp
