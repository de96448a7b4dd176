#pragma once

#include "trialbox/test_result.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace trialbox {

struct ExecutionResult {
    enum class Status : uint8_t {
        Ok,
        SafetyViolation, // rejected before execution
        ExecutionTimeout, // wall-clock limit expired
        CpuLimitExceeded,
        MemoryLimitExceeded,
        FileSizeLimitExceeded,
        ResourceLimitExceeded, // killed from outside for an unspecified reason
        RuntimeFault, // nonzero exit
        TestDiscoveryFailure, // tests were expected but none were found
        TestFailure,
        InternalFault, // the tests could not be run at all
    } status;

    bool success;
    std::string output; // trimmed stdout
    std::string error; // trimmed stderr or the description of the failure
    std::chrono::nanoseconds execution_time;
    std::optional<TestResult> test_result; // set if the tests were run
};

[[nodiscard]] std::string_view to_string(ExecutionResult::Status status) noexcept;

} // namespace trialbox
