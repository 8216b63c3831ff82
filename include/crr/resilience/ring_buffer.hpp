#pragma once

/// @file ring_buffer.hpp
/// @brief Bounded FIFO that evicts its oldest element when full.

#include <cstddef>
#include <deque>
#include <vector>

namespace crr::resilience {

/// Append-only sequence with a fixed capacity. Not synchronized; the owner
/// guards it.
template <typename T>
class RingBuffer {
public:
    using const_iterator = typename std::deque<T>::const_iterator;
    using const_reverse_iterator = typename std::deque<T>::const_reverse_iterator;

    explicit RingBuffer(std::size_t capacity) : capacity_(capacity) {}

    /// Append @p value, dropping the oldest element if the buffer is full.
    void push(T value) {
        if (capacity_ == 0) {
            return;
        }
        if (items_.size() == capacity_) {
            items_.pop_front();
        }
        items_.push_back(std::move(value));
    }

    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    /// Oldest element.
    [[nodiscard]] const T& front() const { return items_.front(); }

    /// Newest element.
    [[nodiscard]] const T& back() const { return items_.back(); }

    /// Element @p index positions after the oldest.
    [[nodiscard]] const T& operator[](std::size_t index) const { return items_[index]; }

    [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return items_.end(); }
    [[nodiscard]] const_reverse_iterator rbegin() const noexcept { return items_.rbegin(); }
    [[nodiscard]] const_reverse_iterator rend() const noexcept { return items_.rend(); }

    /// Oldest-first copy.
    [[nodiscard]] std::vector<T> toVector() const { return {items_.begin(), items_.end()}; }

    void clear() noexcept { items_.clear(); }

private:
    std::size_t capacity_;
    std::deque<T> items_;
};

} // namespace crr::resilience
