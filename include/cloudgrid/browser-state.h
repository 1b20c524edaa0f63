#pragma once

#include <cloudgrid/target.h>
#include <optional>
#include <utility>

namespace cloudgrid {

enum class TargetState {
    Pending,
    Running,
    Ended,
    Failed,
};

const char* targetStateName(TargetState state) noexcept;

/**
 * BrowserState - one target plus what is known about its run.
 *
 *   Pending --init/start--> Running --end--> Ended
 *      |                       |               |
 *      +-------- errored ------+---------------+--> Failed
 *
 * Failed is sticky: a later end stores its results but the state stays
 * Failed. Transitions return true when the state or results changed.
 */
class BrowserState {
public:
    explicit BrowserState(Target target) : _target(std::move(target)) {}

    const Target& target() const { return _target; }
    TargetState state() const { return _state; }
    const std::optional<TestResults>& results() const { return _results; }

    bool hasFailures() const { return _results && _results->failureCount > 0; }

    // init and start events
    bool markRunning();

    // end event
    bool markEnded(TestResults results);

    // errored signal from the remote fleet
    bool markFailed();

private:
    Target _target;
    TargetState _state = TargetState::Pending;
    std::optional<TestResults> _results;
};

} // namespace cloudgrid
