#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cloudgrid {

// One browser/version/platform combination from the capability matrix
struct Target {
    std::string name;
    std::string version;
    std::string platform;

    // "Chrome 70"
    std::string label() const { return name + " " + version; }

    bool operator==(const Target& other) const = default;
};

// "Chrome 70 on Windows 10"
std::string describe(const Target& target);

struct TestFailure {
    std::string title;
    std::string errorMessage;
    std::string errorTrace;  // usually starts with errorMessage
};

struct TestResults {
    uint32_t failureCount = 0;
    std::vector<TestFailure> failedTests;
};

} // namespace cloudgrid
