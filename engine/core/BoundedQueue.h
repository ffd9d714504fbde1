// Thread-safe fixed-capacity queue with an explicit overflow rule.
#pragma once

#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <deque>
#include <mutex>
#include <vector>

namespace Engine {

enum class DropPolicy {
    DropOldest,  // evict the front to make room; the push always lands
    DropNewest   // reject the incoming item; the queue is left untouched
};

enum class PushResult {
    Accepted,
    DroppedOldest,
    Rejected
};

template <typename T>
class BoundedQueue {
public:
    BoundedQueue(std::size_t capacity, DropPolicy policy)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    PushResult push(T item) {
        std::scoped_lock lk(mutex_);
        if (items_.size() < capacity_) {
            items_.push_back(std::move(item));
            return PushResult::Accepted;
        }
        ++dropped_;
        if (policy_ == DropPolicy::DropNewest) {
            return PushResult::Rejected;
        }
        items_.pop_front();
        items_.push_back(std::move(item));
        return PushResult::DroppedOldest;
    }

    bool tryPop(T& out) {
        std::scoped_lock lk(mutex_);
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    // Move up to maxItems from the front into out; returns the number moved.
    std::size_t drain(std::vector<T>& out, std::size_t maxItems) {
        std::scoped_lock lk(mutex_);
        const std::size_t count = std::min(maxItems, items_.size());
        out.reserve(out.size() + count);
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return count;
    }

    void clear() {
        std::scoped_lock lk(mutex_);
        items_.clear();
    }

    std::size_t size() const {
        std::scoped_lock lk(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }
    std::size_t capacity() const { return capacity_; }
    DropPolicy policy() const { return policy_; }

    std::uint64_t droppedCount() const {
        std::scoped_lock lk(mutex_);
        return dropped_;
    }

private:
    const std::size_t capacity_;
    const DropPolicy policy_;
    mutable std::mutex mutex_{};
    std::deque<T> items_{};
    std::uint64_t dropped_{0};
};

}  // namespace Engine
