#pragma once

#include <cloudgrid/browser-state.h>
#include <cloudgrid/result.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace cloudgrid {

struct FailureEntry {
    std::string title;
    std::string displayedError;  // trace cut right after the message
    std::string trace;           // full trace, message when there is none
};

struct FailureReport {
    std::string label;
    std::string platform;
    std::vector<FailureEntry> failures;
};

class FailureReporter {
public:
    // Only valid once every target has ended. A target without results
    // fails the whole call with ErrorKind::MissingResults.
    static Result<std::vector<FailureReport>> collect(const std::vector<BrowserState>& browsers);

    // Sum of failureCount over targets that have results
    static uint32_t totalFailures(const std::vector<BrowserState>& browsers);

    static std::string displayedError(const TestFailure& failure);

    // Console summary. Platform in gray and traces in red when color is set.
    static void print(const std::vector<FailureReport>& reports, std::ostream& out,
                      bool color = true);
};

} // namespace cloudgrid
