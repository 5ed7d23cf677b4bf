#pragma once

#include <cstddef>
#include <vector>

// Fixed-capacity ring that overwrites the oldest element when full.
// Not synchronized: owners guard it with their own mutex.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : buffer_(capacity ? capacity : 1), capacity_(capacity ? capacity : 1) {}

    void push(T item) {
        buffer_[write_pos_] = std::move(item);
        write_pos_ = (write_pos_ + 1) % capacity_;
        if (count_ < capacity_) ++count_;
    }

    // Oldest first.
    std::vector<T> items() const {
        std::vector<T> out;
        out.reserve(count_);
        std::size_t start = (write_pos_ + capacity_ - count_) % capacity_;
        for (std::size_t i = 0; i < count_; ++i) {
            out.push_back(buffer_[(start + i) % capacity_]);
        }
        return out;
    }

    // The newest `n` elements, oldest first.
    std::vector<T> last(std::size_t n) const {
        auto all = items();
        if (n >= all.size()) return all;
        return std::vector<T>(all.end() - static_cast<std::ptrdiff_t>(n), all.end());
    }

    void clear() {
        write_pos_ = 0;
        count_ = 0;
    }

    std::size_t size() const { return count_; }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return count_ == 0; }

private:
    std::vector<T> buffer_;
    std::size_t capacity_;
    std::size_t write_pos_ = 0;
    std::size_t count_ = 0;
};
