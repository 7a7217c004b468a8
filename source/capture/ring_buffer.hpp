#ifndef WEBMCPS_RING_BUFFER_HPP
#define WEBMCPS_RING_BUFFER_HPP

// Fixed-capacity FIFO store. Once full, every push overwrites the oldest
// element. Not synchronised: owners guard it with their own mutex.

#include <cstddef>
#include <utility>
#include <vector>

namespace capture {

template <typename T>
class RingBuffer {
public:
    // A capacity of 0 is treated as 1 so the buffer can always hold the newest element.
    explicit RingBuffer(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {
        slots_.reserve(capacity_);
    }

    // Append an element. Returns true if the oldest element was evicted to make room.
    bool push(T value) {
        if (slots_.size() < capacity_) {
            slots_.push_back(std::move(value));
            return false;
        }
        slots_[head_] = std::move(value);
        head_ = (head_ + 1) % capacity_;
        return true;
    }

    size_t size() const { return slots_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return slots_.empty(); }

    void clear() {
        slots_.clear();
        head_ = 0;
    }

    // Element at position index in arrival order (0 = oldest surviving).
    const T &at(size_t index) const {
        return slots_[(head_ + index) % slots_.size()];
    }

    // Copy of the surviving elements, oldest first.
    std::vector<T> snapshot() const {
        std::vector<T> ordered;
        ordered.reserve(slots_.size());
        for (size_t index = 0; index < slots_.size(); ++index) {
            ordered.push_back(at(index));
        }
        return ordered;
    }

private:
    size_t capacity_;
    // Index of the oldest element once the buffer has wrapped; 0 before that.
    size_t head_ = 0;
    std::vector<T> slots_;
};

} // namespace capture

#endif // WEBMCPS_RING_BUFFER_HPP
