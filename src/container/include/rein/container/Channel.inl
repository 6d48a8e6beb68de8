/**
 * @file Channel.inl
 * @brief Template implementation of Channel.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CONTAINER_CHANNEL_INL
    #define REIN_CONTAINER_CHANNEL_INL

namespace rein::container {

template <typename T>
    requires std::is_move_constructible_v<T>
void Channel<T>::push(T item)
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        _items.push_back(std::move(item));
    }
    _ready.notify_one();
}

template <typename T>
    requires std::is_move_constructible_v<T>
T Channel<T>::pop()
{
    std::unique_lock<std::mutex> lock{_mutex};
    _ready.wait(lock, [this] { return !_items.empty(); });
    T item = std::move(_items.front());
    _items.pop_front();
    return item;
}

template <typename T>
    requires std::is_move_constructible_v<T>
bool Channel<T>::tryPop(T &out)
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (_items.empty())
        return false;
    out = std::move(_items.front());
    _items.pop_front();
    return true;
}

template <typename T>
    requires std::is_move_constructible_v<T>
bool Channel<T>::empty() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _items.empty();
}

template <typename T>
    requires std::is_move_constructible_v<T>
core::usize Channel<T>::size() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _items.size();
}

template <typename T>
    requires std::is_move_constructible_v<T>
core::usize Channel<T>::clear()
{
    std::lock_guard<std::mutex> lock{_mutex};
    const core::usize dropped = _items.size();
    _items.clear();
    return dropped;
}

} // namespace rein::container

#endif // REIN_CONTAINER_CHANNEL_INL
