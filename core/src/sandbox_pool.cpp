#include "evogate/sandbox_pool.h"

#include "evogate/types.h"

#include <chrono>
#include <iostream>
#include <vector>

namespace evogate {

// ---------- Lease ----------

void Lease::release() {
    if (!pool_) return;
    SandboxPool* p = pool_;
    pool_ = nullptr;
    p->release_slot(id_);
}

void Lease::arm_watchdog(int64_t deadline_ms, std::function<void()> abort_action) {
    if (pool_) pool_->arm(id_, deadline_ms, std::move(abort_action));
}

void Lease::disarm_watchdog() {
    if (pool_) pool_->disarm(id_);
}

bool Lease::reclaimed() const {
    return pool_ && pool_->was_reclaimed(id_);
}

// ---------- SandboxPool ----------

SandboxPool::SandboxPool(size_t capacity, int watchdog_tick_ms)
    : capacity_(capacity == 0 ? 1 : capacity), tick_ms_(watchdog_tick_ms > 0 ? watchdog_tick_ms : 20) {}

SandboxPool::~SandboxPool() {
    shutdown();
    stop_watchdog();
}

AcquireStatus SandboxPool::acquire(Lease* out, AcquireMode mode, int timeout_ms) {
    if (!out) return AcquireStatus::POOL_EXHAUSTED;
    out->release();

    std::unique_lock<std::mutex> lk(mu_);
    auto can_take = [&] { return closed_ || active_.size() < capacity_; };

    if (mode == AcquireMode::FAIL_FAST) {
        if (!can_take()) return AcquireStatus::POOL_EXHAUSTED;
    } else if (timeout_ms < 0) {
        slot_cv_.wait(lk, can_take);
    } else if (!slot_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), can_take)) {
        return AcquireStatus::POOL_EXHAUSTED;
    }
    if (closed_) return AcquireStatus::POOL_EXHAUSTED;

    uint64_t id = next_id_++;
    active_.emplace(id, Slot{});
    total_acquired_++;
    if (active_.size() > peak_) peak_ = active_.size();
    *out = Lease(this, id);
    return AcquireStatus::OK;
}

void SandboxPool::release_slot(uint64_t id) {
    std::unique_lock<std::mutex> lk(mu_);
    if (reclaimed_.erase(id) > 0) return;
    auto it = active_.find(id);
    if (it == active_.end()) return;
    // Never free the slot under a running abort action.
    fire_cv_.wait(lk, [&] {
        auto cur = active_.find(id);
        return cur == active_.end() || !cur->second.firing;
    });
    if (reclaimed_.erase(id) > 0) return;
    active_.erase(id);
    slot_cv_.notify_one();
}

void SandboxPool::arm(uint64_t id, int64_t deadline_ms, std::function<void()> abort) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = active_.find(id);
    if (it == active_.end()) return;
    it->second.armed = true;
    it->second.deadline_ms = deadline_ms;
    it->second.abort = std::move(abort);
    wd_cv_.notify_all();
}

void SandboxPool::disarm(uint64_t id) {
    std::unique_lock<std::mutex> lk(mu_);
    fire_cv_.wait(lk, [&] {
        auto cur = active_.find(id);
        return cur == active_.end() || !cur->second.firing;
    });
    auto it = active_.find(id);
    if (it == active_.end()) return;
    it->second.armed = false;
    it->second.abort = nullptr;
}

bool SandboxPool::was_reclaimed(uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return reclaimed_.count(id) > 0;
}

void SandboxPool::start_watchdog() {
    std::lock_guard<std::mutex> lk(mu_);
    if (wd_running_) return;
    wd_running_ = true;
    wd_stop_ = false;
    watchdog_ = std::thread([this] { watchdog_loop(); });
}

void SandboxPool::stop_watchdog() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!wd_running_) return;
        wd_stop_ = true;
        wd_cv_.notify_all();
    }
    if (watchdog_.joinable()) watchdog_.join();
    std::lock_guard<std::mutex> lk(mu_);
    wd_running_ = false;
}

void SandboxPool::watchdog_loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!wd_stop_) {
        wd_cv_.wait_for(lk, std::chrono::milliseconds(tick_ms_));
        if (wd_stop_) break;

        const int64_t now = now_ms();
        std::vector<std::pair<uint64_t, std::function<void()>>> due;
        for (auto& kv : active_) {
            Slot& s = kv.second;
            if (s.armed && !s.firing && s.deadline_ms <= now) {
                s.armed = false;
                s.firing = true;
                due.emplace_back(kv.first, std::move(s.abort));
                s.abort = nullptr;
            }
        }
        if (due.empty()) continue;

        lk.unlock();
        for (auto& d : due) {
            std::cerr << "[pool] watchdog: lease " << d.first << " overran its deadline, aborting\n";
            if (d.second) d.second();
        }
        lk.lock();

        for (auto& d : due) {
            auto it = active_.find(d.first);
            if (it == active_.end()) continue;
            active_.erase(it);
            reclaimed_.insert(d.first);
            reclaims_++;
        }
        fire_cv_.notify_all();
        slot_cv_.notify_all();
    }
}

void SandboxPool::shutdown() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    slot_cv_.notify_all();
}

bool SandboxPool::is_shut_down() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

size_t SandboxPool::in_use() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_.size();
}

size_t SandboxPool::peak_in_use() const {
    std::lock_guard<std::mutex> lk(mu_);
    return peak_;
}

uint64_t SandboxPool::total_acquired() const {
    std::lock_guard<std::mutex> lk(mu_);
    return total_acquired_;
}

uint64_t SandboxPool::watchdog_reclaims() const {
    std::lock_guard<std::mutex> lk(mu_);
    return reclaims_;
}

} // namespace evogate
