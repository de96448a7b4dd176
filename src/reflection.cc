#include "trialbox/reflection.hh"
#include "trialbox/string_transform.hh"

#include <algorithm>
#include <sstream>

namespace trialbox {

std::string build_reflection(const ShortTermMemory& memory) {
    if (memory.count() == 0) {
        return "";
    }
    auto summary = memory.get_summary();
    std::ostringstream out;
    out << "\n## Reflection on Previous Attempts\n\n";
    out << "You have made " << summary.total_attempts << " attempt(s) so far.\n";
    out << "Progress status: " << to_string(summary.progress) << "\n\n";

    if (memory.has_pattern(Pattern::SameError)) {
        out << "WARNING: You've had the same error in your last 2 attempts. Try a completely "
               "different approach.\n\n";
    }
    if (memory.has_pattern(Pattern::SameTestFailure)) {
        out << "WARNING: The same test is failing repeatedly. Focus specifically on fixing that "
               "test.\n\n";
    }
    if (memory.has_pattern(Pattern::NoProgress)) {
        out << "WARNING: No tests have passed in 3 attempts. Consider rewriting from scratch "
               "with a simpler approach.\n\n";
    }

    if (memory.count() >= 2) {
        out << "Recent attempts:\n";
        for (const auto& attempt : memory.get_recent(3)) {
            out << "\nAttempt " << attempt.iteration << ": "
                << (attempt.success ? "SUCCESS" : "FAILED") << '\n';
            if (attempt.test_results) {
                const auto& tr = *attempt.test_results;
                out << "  Tests: " << tr.passed << '/' << tr.total_tests << " passed\n";
                if (not tr.failures.empty()) {
                    out << "  Failed tests:\n";
                    auto shown = std::min<size_t>(tr.failures.size(), 2);
                    for (size_t i = 0; i < shown; ++i) {
                        out << "    - " << tr.failures[i].test_name << ": "
                            << tr.failures[i].message << '\n';
                    }
                }
            }
            if (not attempt.success and not attempt.error.empty()) {
                out << "  Error: " << truncated(first_line(attempt.error), 100) << '\n';
            }
        }
    }

    out << "\nBefore writing new code, ask yourself:\n"
           "1. What specifically went wrong in the last attempt?\n"
           "2. Am I repeating the same approach? Should I try something different?\n"
           "3. Are there edge cases I'm missing?\n\n";
    return std::move(out).str();
}

} // namespace trialbox
