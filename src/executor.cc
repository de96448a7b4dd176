#include "trialbox/concat_tostr.hh"
#include "trialbox/debug.hh"
#include "trialbox/errors.hh"
#include "trialbox/executor.hh"

#include <exception>

using std::chrono::nanoseconds;

namespace {

constexpr DebugLogger<debug_logs_enabled, false> debuglog{};

} // namespace

namespace trialbox {

ExecutionResult Executor::execute(std::string_view code, nanoseconds timeout) {
    RunOutcome outcome;
    try {
        outcome = runner_.run(runner_.suite().program(code), timeout);
    } catch (const ScratchAreaError&) {
        throw;
    } catch (const std::exception& e) {
        debuglog("executor: ", e.what());
        return {
            .status = ExecutionResult::Status::InternalFault,
            .success = false,
            .output = {},
            .error = concat_tostr("Execution failed: ", e.what()),
            .execution_time = nanoseconds{0},
            .test_result = std::nullopt,
        };
    }

    auto er = runner_.classify(outcome, timeout);
    if (er.success and runner_.suite().defines_tests(code)) {
        merge_test_result(er, harness_.run(code, timeout));
    }
    return er;
}

void merge_test_result(ExecutionResult& er, TestResult tr) {
    er.success = er.success and tr.success;

    if (not er.output.empty()) {
        er.output += '\n';
    }
    er.output += concat_tostr("Tests: ", tr.passed, '/', tr.total_tests, " passed");

    for (const auto& failure : tr.failures) {
        if (not er.error.empty()) {
            er.error += "\n\n";
        }
        er.error += concat_tostr(
            "FAILED ", failure.test_name, " (", failure.error_kind, ")\n", failure.message);
    }

    if (not tr.success) {
        if (tr.total_tests > 0) {
            er.status = ExecutionResult::Status::TestFailure;
        } else if (not tr.failures.empty() and tr.failures.front().error_kind == "NoTestsFound")
        {
            er.status = ExecutionResult::Status::TestDiscoveryFailure;
        } else {
            er.status = ExecutionResult::Status::InternalFault;
        }
    }
    er.test_result = std::move(tr);
}

} // namespace trialbox
