#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace evogate {

// ConcurrentPriorityQueue: the controller's request queue.
// Larger priority pops first; equal priorities pop in push order.
// shutdown() wakes every waiter; afterwards push() and pop() refuse and the
// leftovers are only reachable through drain().
template <typename T>
class ConcurrentPriorityQueue {
public:
    struct Item {
        int32_t priority{0};
        uint64_t seq{0};
        T value;
    };

    bool push(int32_t priority, T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        const uint64_t seq = next_seq_++;
        items_.emplace(Key{priority, seq}, std::move(value));
        cv_.notify_one();
        return true;
    }

    // Blocks until an item arrives or the queue shuts down.
    bool pop(Item& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return closed_ || !items_.empty(); });
        if (closed_) return false;
        take_front(out);
        return true;
    }

    bool try_pop(Item& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_ || items_.empty()) return false;
        take_front(out);
        return true;
    }

    // Drops the first queued item equal to `value`.
    bool erase(const T& value) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (it->second == value) {
                items_.erase(it);
                return true;
            }
        }
        return false;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::vector<Item> drain() {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<Item> out;
        out.reserve(items_.size());
        for (auto& kv : items_) out.push_back(Item{kv.first.priority, kv.first.seq, std::move(kv.second)});
        items_.clear();
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return items_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    struct Key {
        int32_t priority;
        uint64_t seq;
        bool operator<(const Key& o) const {
            if (priority != o.priority) return priority > o.priority;
            return seq < o.seq;
        }
    };

    void take_front(Item& out) {
        auto it = items_.begin();
        out.priority = it->first.priority;
        out.seq = it->first.seq;
        out.value = std::move(it->second);
        items_.erase(it);
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::map<Key, T> items_;
    uint64_t next_seq_{0};
    bool closed_{false};
};

} // namespace evogate
