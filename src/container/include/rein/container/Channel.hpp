/**
 * @file Channel.hpp
 * @brief Unbounded FIFO channel with blocking receive and non-blocking poll.
 *
 * A Channel is the queue behind every controller endpoint.  Consumers that
 * run on the cooperative update thread must gate pop() behind empty() or
 * use tryPop(); pop() suspends the calling thread until an item arrives.
 *
 * @tparam T Element type (must be move-constructible).
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CONTAINER_CHANNEL_HPP
    #define REIN_CONTAINER_CHANNEL_HPP

    #include <rein/core/NonCopyable.hpp>
    #include <rein/core/Types.hpp>

    #include <condition_variable>
    #include <deque>
    #include <mutex>
    #include <type_traits>

namespace rein::container {

/**
 * @brief Mutex-guarded FIFO queue.
 *
 * Every operation takes the internal lock, so a Channel may be fed from a
 * transport thread while the update thread consumes it.  Ordering is strict
 * FIFO; there is no priority and no deduplication.
 */
template <typename T>
    requires std::is_move_constructible_v<T>
class Channel final : public core::NonCopyable<Channel<T>> {
public:
    Channel()  = default;
    ~Channel() = default;

    /**
     * @brief Append one element and wake a blocked consumer.
     * @param item Element to enqueue.
     */
    void push(T item);

    /**
     * @brief Remove and return the oldest element, blocking while empty.
     */
    [[nodiscard]] T pop();

    /**
     * @brief Remove the oldest element if one is available.
     * @param[out] out Destination for the dequeued element.
     * @return True on success, false if the channel is empty.
     */
    bool tryPop(T &out);

    [[nodiscard]] bool        empty() const;
    [[nodiscard]] core::usize size()  const;

    /**
     * @brief Discard every queued element.
     * @return Number of elements dropped.
     */
    core::usize clear();

private:
    mutable std::mutex      _mutex;
    std::condition_variable _ready;
    std::deque<T>           _items;
};

} // namespace rein::container

    #include "Channel.inl"

#endif // REIN_CONTAINER_CHANNEL_HPP
