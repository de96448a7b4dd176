#pragma once

#include "trialbox/execution_result.hh"
#include "trialbox/runner.hh"
#include "trialbox/test_harness.hh"

#include <chrono>
#include <string_view>

namespace trialbox {

// Runs candidate code and, if the code declares test cases, its tests
class Executor {
    Runner runner_;
    TestHarness harness_;

public:
    Executor(
        const language_suite::Suite& suite, ScratchArea& scratch, RunLimits limits,
        std::string path_env, std::chrono::nanoseconds timeout)
    : runner_{suite, scratch, limits, std::move(path_env)}
    , harness_{runner_, timeout} {}

    Executor(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor& operator=(Executor&&) = delete;
    ~Executor() = default;

    // Failures are reported in the result, except for ScratchAreaError that is thrown
    [[nodiscard]] ExecutionResult execute(std::string_view code, std::chrono::nanoseconds timeout);

    [[nodiscard]] TestResult run_tests(std::string_view code, std::chrono::nanoseconds timeout) {
        return harness_.run(code, timeout);
    }
};

// Merges the result of the tests of the code into the result of its run
void merge_test_result(ExecutionResult& er, TestResult tr);

} // namespace trialbox
