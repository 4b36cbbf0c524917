#pragma once
#include "observer.h"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace evogate {

// JsonlEventLog: one canonical JSON line per state transition, hash-chained
// (chain_hash = SHA256(chain_prev || canonical record)).
// Opening an existing log continues its chain and step counter. A log whose
// last line cannot be parsed is left untouched and ok() is false.
class JsonlEventLog : public ITransitionObserver {
public:
    explicit JsonlEventLog(const std::string& path);

    void on_transition(const TransitionEvent& ev) override;

    const std::string& path() const { return path_; }
    bool ok() const { return out_.is_open() && out_.good(); }
    uint64_t steps() const {
        std::lock_guard<std::mutex> lk(mu_);
        return step_;
    }

private:
    std::string resume();

    std::string path_;
    std::ofstream out_;
    mutable std::mutex mu_;
    std::string chain_prev_;
    uint64_t step_{0};
};

} // namespace evogate
