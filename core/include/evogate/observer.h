#pragma once

#include "types.h"

#include <cstdint>
#include <string>

namespace evogate {

struct TransitionEvent {
    std::string request_id;
    RequestState from{RequestState::SUBMITTED};
    RequestState to{RequestState::SUBMITTED};
    int64_t at_ms{0};
    std::string detail;     // first decision reason, error, reviewer, ...
};

// Receives every state transition of the controller. Called on the thread
// that made the transition, outside the controller's locks; implementations
// synchronize themselves.
class ITransitionObserver {
public:
    virtual ~ITransitionObserver() = default;
    virtual void on_transition(const TransitionEvent& ev) = 0;
};

} // namespace evogate
