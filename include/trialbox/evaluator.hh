#pragma once

#include "trialbox/config.hh"
#include "trialbox/execution_result.hh"
#include "trialbox/executor.hh"
#include "trialbox/language_suite/suite.hh"
#include "trialbox/safety_scanner.hh"
#include "trialbox/scratch_area.hh"

#include <memory>
#include <string_view>

namespace trialbox {

// The evaluation pipeline: safety check, sandboxed run, tests
class Evaluator {
    Config config_;
    std::unique_ptr<language_suite::Suite> suite_;
    ScratchArea scratch_;
    SafetyScanner scanner_;
    Executor executor_;

public:
    // Throws ConfigError on invalid @p config and ScratchAreaError if the scratch area cannot be
    // created
    explicit Evaluator(Config config);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] const language_suite::Suite& suite() const noexcept { return *suite_; }

    [[nodiscard]] const SafetyScanner& scanner() const noexcept { return scanner_; }

    // Code rejected by the scanner is not run at all
    [[nodiscard]] ExecutionResult evaluate(std::string_view code);

    // Runs only the test cases of @p code (without the safety check)
    [[nodiscard]] TestResult run_tests(std::string_view code);
};

} // namespace trialbox
