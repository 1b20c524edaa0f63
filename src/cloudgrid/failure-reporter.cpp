#include <cloudgrid/failure-reporter.h>

#include <ostream>
#include <ytrace/ytrace.hpp>

namespace cloudgrid {

Result<std::vector<FailureReport>> FailureReporter::collect(
    const std::vector<BrowserState>& browsers) {
    std::vector<FailureReport> reports;

    for (const auto& browser : browsers) {
        const auto& results = browser.results();
        if (!results) {
            return Err<std::vector<FailureReport>>(
                "no results for " + describe(browser.target()), ErrorKind::MissingResults);
        }
        if (results->failureCount == 0) continue;

        FailureReport report;
        report.label = browser.target().label();
        report.platform = browser.target().platform;
        for (const auto& test : results->failedTests) {
            FailureEntry entry;
            entry.title = test.title;
            entry.displayedError = displayedError(test);
            entry.trace = test.errorTrace.empty() ? test.errorMessage : test.errorTrace;
            report.failures.push_back(std::move(entry));
        }
        ydebug("FailureReporter: {} has {} failure(s)", describe(browser.target()),
               results->failureCount);
        reports.push_back(std::move(report));
    }
    return Ok(std::move(reports));
}

uint32_t FailureReporter::totalFailures(const std::vector<BrowserState>& browsers) {
    uint32_t total = 0;
    for (const auto& browser : browsers) {
        if (browser.results()) total += browser.results()->failureCount;
    }
    return total;
}

std::string FailureReporter::displayedError(const TestFailure& failure) {
    const std::string& msg = failure.errorMessage;
    const std::string& trace = failure.errorTrace.empty() ? msg : failure.errorTrace;

    auto pos = trace.find(msg);
    if (pos == std::string::npos) {
        // trace does not repeat the message; the message is all we can show
        return msg;
    }
    return trace.substr(0, pos + msg.size());
}

// Prefix every line, including the empty one after a trailing newline
static std::string indent(const std::string& text, const std::string& prefix) {
    std::string out = prefix;
    for (char c : text) {
        out += c;
        if (c == '\n') out += prefix;
    }
    return out;
}

void FailureReporter::print(const std::vector<FailureReport>& reports, std::ostream& out,
                            bool color) {
    const char* gray = color ? "\033[90m" : "";
    const char* red = color ? "\033[31m" : "";
    const char* reset = color ? "\033[m" : "";

    for (const auto& report : reports) {
        out << '\n';
        out << "   " << report.label << '\n';
        out << "   " << gray << report.platform << reset << '\n';

        int n = 0;
        for (const auto& failure : report.failures) {
            out << '\n';
            out << "    " << ++n << ") " << failure.title << '\n';
            out << red << indent(failure.trace, "       ") << reset << '\n';
        }
        out << '\n';
    }
    out.flush();
}

} // namespace cloudgrid
