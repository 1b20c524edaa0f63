#include <cloudgrid/browser-state.h>

namespace cloudgrid {

const char* targetStateName(TargetState state) noexcept {
    switch (state) {
        case TargetState::Pending: return "pending";
        case TargetState::Running: return "running";
        case TargetState::Ended:   return "ended";
        case TargetState::Failed:  return "failed";
    }
    return "unknown";
}

bool BrowserState::markRunning() {
    if (_state != TargetState::Pending) return false;
    _state = TargetState::Running;
    return true;
}

bool BrowserState::markEnded(TestResults results) {
    _results = std::move(results);
    if (_state != TargetState::Failed) {
        _state = TargetState::Ended;
    }
    return true;
}

bool BrowserState::markFailed() {
    if (_state == TargetState::Failed) return false;
    _state = TargetState::Failed;
    return true;
}

} // namespace cloudgrid
