#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace evogate {

class SandboxPool;

enum class AcquireStatus {
    OK,
    POOL_EXHAUSTED,     // fail-fast with no free slot, blocking timeout, or pool shut down
};

enum class AcquireMode {
    BLOCKING,
    FAIL_FAST,
};

// Scoped pool slot. Releasing is idempotent: after a watchdog reclaim, or a
// second release, nothing happens.
class Lease {
public:
    Lease() = default;
    ~Lease() { release(); }

    Lease(Lease&& o) noexcept : pool_(o.pool_), id_(o.id_) {
        o.pool_ = nullptr;
        o.id_ = 0;
    }
    Lease& operator=(Lease&& o) noexcept {
        if (this != &o) {
            release();
            pool_ = o.pool_;
            id_ = o.id_;
            o.pool_ = nullptr;
            o.id_ = 0;
        }
        return *this;
    }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    bool valid() const { return pool_ != nullptr; }
    uint64_t id() const { return id_; }

    void release();

    // Registers a deadline (epoch ms) with the pool watchdog. When it passes,
    // the watchdog calls abort_action once and reclaims the slot.
    void arm_watchdog(int64_t deadline_ms, std::function<void()> abort_action);

    // Cancels the deadline; if the abort action is running right now, waits
    // for it to return. Call before destroying anything the action touches.
    void disarm_watchdog();

    // True once the watchdog fired for this lease.
    bool reclaimed() const;

private:
    friend class SandboxPool;
    Lease(SandboxPool* pool, uint64_t id) : pool_(pool), id_(id) {}

    SandboxPool* pool_{nullptr};
    uint64_t id_{0};
};

// Counting semaphore over sandbox slots plus a watchdog thread.
class SandboxPool {
public:
    explicit SandboxPool(size_t capacity, int watchdog_tick_ms = 20);
    ~SandboxPool();

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    // timeout_ms < 0: wait indefinitely (BLOCKING only).
    AcquireStatus acquire(Lease* out, AcquireMode mode = AcquireMode::BLOCKING, int timeout_ms = -1);

    void start_watchdog();
    void stop_watchdog();

    // Wakes all waiters with POOL_EXHAUSTED; later acquires fail fast.
    void shutdown();
    bool is_shut_down() const;

    size_t capacity() const { return capacity_; }
    size_t in_use() const;
    size_t peak_in_use() const;
    uint64_t total_acquired() const;
    uint64_t watchdog_reclaims() const;

private:
    friend class Lease;

    struct Slot {
        bool armed{false};
        bool firing{false};
        int64_t deadline_ms{0};
        std::function<void()> abort;
    };

    void release_slot(uint64_t id);
    void arm(uint64_t id, int64_t deadline_ms, std::function<void()> abort);
    void disarm(uint64_t id);
    bool was_reclaimed(uint64_t id) const;
    void watchdog_loop();

    const size_t capacity_;
    const int tick_ms_;

    mutable std::mutex mu_;
    std::condition_variable slot_cv_;     // acquire waiters
    std::condition_variable fire_cv_;     // disarm waiting on a firing abort
    std::condition_variable wd_cv_;       // watchdog wakeup
    std::map<uint64_t, Slot> active_;
    std::set<uint64_t> reclaimed_;
    uint64_t next_id_{1};
    size_t peak_{0};
    uint64_t total_acquired_{0};
    uint64_t reclaims_{0};
    bool closed_{false};

    std::thread watchdog_;
    bool wd_running_{false};
    bool wd_stop_{false};
};

} // namespace evogate
