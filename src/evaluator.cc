#include "trialbox/debug.hh"
#include "trialbox/errors.hh"
#include "trialbox/evaluator.hh"
#include "trialbox/macros/throw.hh"

namespace {

constexpr DebugLogger<debug_logs_enabled, false> debuglog{};

std::unique_ptr<trialbox::language_suite::Suite> suite_for(const trialbox::Config& config) {
    config.validate();
    auto suite = trialbox::language_suite::make_suite(config.language, config.interpreter);
    if (not suite) {
        THROW_AS(trialbox::ConfigError, "unknown language: ", config.language);
    }
    return suite;
}

} // namespace

namespace trialbox {

Evaluator::Evaluator(Config config)
: config_{std::move(config)}
, suite_{suite_for(config_)}
, scratch_{config_.scratch_dir}
, scanner_{suite_->blocklist()}
, executor_{
      *suite_, scratch_,
      RunLimits{
          .cpu_time = config_.cpu_time_limit,
          .memory_in_bytes = config_.memory_limit_in_bytes,
          .file_size_in_bytes = config_.max_file_size_in_bytes,
      },
      config_.path_env, config_.timeout} {}

ExecutionResult Evaluator::evaluate(std::string_view code) {
    auto verdict = scanner_.check(code);
    if (not verdict.is_safe) {
        debuglog("evaluator: ", verdict.reason);
        return {
            .status = ExecutionResult::Status::SafetyViolation,
            .success = false,
            .output = {},
            .error = std::move(verdict.reason),
            .execution_time = std::chrono::nanoseconds{0},
            .test_result = std::nullopt,
        };
    }
    return executor_.execute(code, config_.timeout);
}

TestResult Evaluator::run_tests(std::string_view code) {
    return executor_.run_tests(code, config_.timeout);
}

} // namespace trialbox
