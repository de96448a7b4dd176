#pragma once

#include "trialbox/execution_result.hh"
#include "trialbox/language_suite/suite.hh"
#include "trialbox/sandbox.hh"
#include "trialbox/scratch_area.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace trialbox {

struct RunLimits {
    std::chrono::nanoseconds cpu_time;
    uint64_t memory_in_bytes;
    uint64_t file_size_in_bytes;
};

struct RunOutcome {
    sandbox::Result result;
    std::string stdout_contents;
    std::string stderr_contents;
};

// Runs programs of one language suite inside the scratch area under the resource limits
class Runner {
    const language_suite::Suite& suite_;
    ScratchArea& scratch_;
    RunLimits limits_;
    std::string path_env_;

public:
    Runner(
        const language_suite::Suite& suite, ScratchArea& scratch, RunLimits limits,
        std::string path_env) noexcept
    : suite_{suite}
    , scratch_{scratch}
    , limits_{limits}
    , path_env_{std::move(path_env)} {}

    [[nodiscard]] const language_suite::Suite& suite() const noexcept { return suite_; }

    // Stores @p program in a new run directory of the scratch area and runs it there with stdin
    // bound to /dev/null and the output captured. The run directory, along with every file the
    // program created in it, is removed on every path. Throws ScratchAreaError if the scratch
    // area fails and std::runtime_error if the program cannot be run.
    [[nodiscard]] RunOutcome run(std::string_view program, std::chrono::nanoseconds timeout);

    // Maps the outcome of run() onto the execution result (test_result is left unset)
    [[nodiscard]] ExecutionResult
    classify(const RunOutcome& outcome, std::chrono::nanoseconds timeout) const;
};

// Returns the "Name" of the last "Name: message" line of @p stderr_contents, if there is one
[[nodiscard]] std::optional<std::string_view>
fault_kind_from_stderr(std::string_view stderr_contents) noexcept;

// Renders @p dur in seconds, e.g. "0.3" or "10"
[[nodiscard]] std::string seconds_str(std::chrono::nanoseconds dur);

} // namespace trialbox
