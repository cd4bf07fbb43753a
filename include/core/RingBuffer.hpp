#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace core {

/**
 * Fixed-capacity ring buffer with overwrite-oldest semantics.
 * Single-threaded: a buffer belongs to exactly one session.
 *
 * push() never blocks and never fails; once full, each push evicts the
 * oldest element. Indexing is logical, 0 = oldest retained element.
 *
 * @tparam T Element type
 */
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : buffer_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be > 0");
        }
    }

    /**
     * Appends an item.
     * Returns true if the oldest element was evicted to make room.
     */
    bool push(T item) {
        bool evicted = false;
        if (size_ == buffer_.size()) {
            head_ = (head_ + 1) % buffer_.size();
            --size_;
            ++evicted_;
            evicted = true;
        }
        buffer_[(head_ + size_) % buffer_.size()] = std::move(item);
        ++size_;
        return evicted;
    }

    const T& operator[](size_t i) const { return buffer_[(head_ + i) % buffer_.size()]; }

    const T& front() const { return (*this)[0]; }
    const T& back() const { return (*this)[size_ - 1]; }

    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == buffer_.size(); }
    size_t size() const { return size_; }
    size_t capacity() const { return buffer_.size(); }

    // Total number of elements overwritten since construction
    size_t evicted() const { return evicted_; }

    std::vector<T> toVector() const {
        std::vector<T> out;
        out.reserve(size_);
        for (size_t i = 0; i < size_; ++i) out.push_back((*this)[i]);
        return out;
    }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::vector<T> buffer_;
    size_t head_ = 0;
    size_t size_ = 0;
    size_t evicted_ = 0;
};

} // namespace core
