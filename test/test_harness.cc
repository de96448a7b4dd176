#include "temporary_directory.hh"

#include <gtest/gtest.h>
#include <trialbox/language_suite/sh.hh>
#include <trialbox/scratch_area.hh>
#include <trialbox/test_harness.hh>

using std::chrono::milliseconds;
using trialbox::parse_report;
using trialbox::RunFault;
using trialbox::TestFailure;
using trialbox::TestReport;
using trialbox::to_test_result;
using Outcome = trialbox::TestReport::Entry::Outcome;

// NOLINTNEXTLINE
TEST(parse_report, empty) { ASSERT_EQ(parse_report(""), TestReport{}); }

// NOLINTNEXTLINE
TEST(parse_report, registrations_and_results) {
    auto report = parse_report(
        "program output\n"
        "@trialbox:register Math.test_add\n"
        "@trialbox:register Math.test_sub\n"
        "@trialbox:register Math.test_div\n"
        "@trialbox:register Math.test_add\n"
        "@trialbox:result Math.test_add ok\n"
        "noise\n"
        "@trialbox:result Math.test_sub fail AssertionError: 4 != 5\n"
        "@trialbox:diag Traceback (most recent call last):\n"
        "@trialbox:diag AssertionError: 4 != 5\n"
        "@trialbox:result Math.test_div error ZeroDivisionError division by zero\r\n"
        "@trialbox:diag ZeroDivisionError: division by zero\n"
    );
    ASSERT_EQ(
        report.registered,
        (std::vector<std::string>{"Math.test_add", "Math.test_sub", "Math.test_div"}));
    ASSERT_EQ(report.results.size(), 3);
    ASSERT_EQ(
        report.results[0],
        (TestReport::Entry{
            .test_name = "Math.test_add",
            .outcome = Outcome::Ok,
            .error_kind = "",
            .message = "",
            .diagnostic = "",
        }));
    ASSERT_EQ(
        report.results[1],
        (TestReport::Entry{
            .test_name = "Math.test_sub",
            .outcome = Outcome::Fail,
            .error_kind = "",
            .message = "AssertionError: 4 != 5",
            .diagnostic = "Traceback (most recent call last):\nAssertionError: 4 != 5",
        }));
    ASSERT_EQ(
        report.results[2],
        (TestReport::Entry{
            .test_name = "Math.test_div",
            .outcome = Outcome::Error,
            .error_kind = "ZeroDivisionError",
            .message = "division by zero",
            .diagnostic = "ZeroDivisionError: division by zero",
        }));
    ASSERT_EQ(report.fault, std::nullopt);
}

// NOLINTNEXTLINE
TEST(parse_report, suites) {
    auto report = parse_report(
        "@trialbox:suite Math\n"
        "@trialbox:suite Empty\n"
        "@trialbox:suite Math\n"
        "@trialbox:register Math.test_add\n");
    ASSERT_EQ(report.suites, (std::vector<std::string>{"Math", "Empty"}));
    ASSERT_EQ(report.registered, std::vector<std::string>{"Math.test_add"});
}

// NOLINTNEXTLINE
TEST(parse_report, fault_and_orphaned_diag) {
    auto report = parse_report(
        "@trialbox:diag ignored\n"
        "@trialbox:fault NameError name 'x' is not defined\n"
        "@trialbox:diag line 1\n"
        "@trialbox:diag line 2\n"
        "@trialbox:fault SyntaxError second fault\n"
    );
    ASSERT_TRUE(report.registered.empty());
    ASSERT_TRUE(report.results.empty());
    ASSERT_EQ(
        report.fault,
        (TestReport::Fault{
            .kind = "NameError",
            .message = "name 'x' is not defined",
            .diagnostic = "line 1\nline 2",
        }));
}

// NOLINTNEXTLINE
TEST(parse_report, records_have_to_start_lines) {
    auto report = parse_report("say @trialbox:register A.b\n@trialbox:result A.b maybe\n");
    ASSERT_EQ(report, TestReport{});
}

// NOLINTNEXTLINE
TEST(to_test_result, all_passed) {
    auto tr = to_test_result(
        parse_report(
            "@trialbox:register A.x\n@trialbox:register A.y\n"
            "@trialbox:result A.x ok\n@trialbox:result A.y ok\n"),
        std::nullopt);
    ASSERT_EQ(tr.total_tests, 2);
    ASSERT_EQ(tr.passed, 2);
    ASSERT_EQ(tr.failed, 0);
    ASSERT_EQ(tr.errors, 0);
    ASSERT_TRUE(tr.failures.empty());
    ASSERT_TRUE(tr.success);
}

// NOLINTNEXTLINE
TEST(to_test_result, failures_before_errors) {
    auto tr = to_test_result(
        parse_report(
            "@trialbox:register A.err\n@trialbox:register A.fail\n@trialbox:register A.ok\n"
            "@trialbox:result A.err error KeyError 'k'\n"
            "@trialbox:result A.fail fail expected '5' but got '4'\n"
            "@trialbox:result A.ok ok\n"),
        std::nullopt);
    ASSERT_EQ(tr.total_tests, 3);
    ASSERT_EQ(tr.passed, 1);
    ASSERT_EQ(tr.failed, 1);
    ASSERT_EQ(tr.errors, 1);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(
        tr.failures,
        (std::vector<TestFailure>{
            {
                .test_name = "A.fail",
                .error_kind = "AssertionError",
                .message = "expected '5' but got '4'",
                .full_diagnostic = "expected '5' but got '4'",
            },
            {
                .test_name = "A.err",
                .error_kind = "KeyError",
                .message = "'k'",
                .full_diagnostic = "'k'",
            },
        }));
}

// NOLINTNEXTLINE
TEST(to_test_result, fault_before_any_result) {
    auto tr = to_test_result(
        parse_report("@trialbox:fault NameError name 'foo' is not defined\n"
                     "@trialbox:diag Traceback\n"
                     "@trialbox:diag NameError: name 'foo' is not defined\n"),
        std::nullopt);
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(
        tr.failures,
        (std::vector<TestFailure>{{
            .test_name = "code_execution",
            .error_kind = "NameError",
            .message = "name 'foo' is not defined",
            .full_diagnostic = "Traceback\nNameError: name 'foo' is not defined",
        }}));
}

// NOLINTNEXTLINE
TEST(to_test_result, no_tests) {
    auto tr = to_test_result(parse_report("hello\n"), std::nullopt);
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_EQ(tr.passed, 0);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "code_structure");
    ASSERT_EQ(tr.failures[0].error_kind, "NoTestsFound");
    ASSERT_EQ(tr.failures[0].message, "No test cases found in code");
}

// NOLINTNEXTLINE
TEST(to_test_result, suite_without_tests) {
    auto tr = to_test_result(parse_report("@trialbox:suite Empty\n"), std::nullopt);
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_EQ(tr.passed, 0);
    ASSERT_TRUE(tr.success);
    ASSERT_TRUE(tr.failures.empty());
}

// NOLINTNEXTLINE
TEST(to_test_result, died_before_registration) {
    auto tr = to_test_result(
        parse_report(""),
        RunFault{.kind = "ExecutionTimeout", .description = "Execution timed out after 1 seconds"}
    );
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "code_execution");
    ASSERT_EQ(tr.failures[0].error_kind, "ExecutionTimeout");
    ASSERT_EQ(tr.failures[0].message, "Execution timed out after 1 seconds");
}

// NOLINTNEXTLINE
TEST(to_test_result, interrupted_tests) {
    auto tr = to_test_result(
        parse_report("@trialbox:register A.x\n@trialbox:register A.y\n@trialbox:result A.x ok\n"),
        RunFault{.kind = "CpuLimitExceeded", .description = "CPU time limit of 1 seconds exceeded"}
    );
    ASSERT_EQ(tr.total_tests, 2);
    ASSERT_EQ(tr.passed, 1);
    ASSERT_EQ(tr.errors, 1);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "A.y");
    ASSERT_EQ(tr.failures[0].error_kind, "Interrupted");
    ASSERT_EQ(tr.failures[0].message, "CPU time limit of 1 seconds exceeded");
}

class test_harness_sh : public ::testing::Test {
protected:
    TemporaryDirectory tmp_dir;
    trialbox::language_suite::Sh suite;
    trialbox::ScratchArea scratch{tmp_dir.path()};
    trialbox::Runner runner{
        suite, scratch,
        trialbox::RunLimits{
            .cpu_time = std::chrono::seconds{2},
            .memory_in_bytes = uint64_t{256} << 20,
            .file_size_in_bytes = uint64_t{1} << 20,
        },
        "/usr/bin:/bin"};
    trialbox::TestHarness harness{runner, std::chrono::seconds{5}};

    void SetUp() override {
        if (not suite.is_supported()) {
            GTEST_SKIP() << "/bin/sh is not available";
        }
    }

    void TearDown() override { EXPECT_TRUE(tmp_dir.entries().empty()); }
};

// NOLINTNEXTLINE
TEST_F(test_harness_sh, reports_failing_test) {
    auto tr = harness.run(R"sh(
tb_suite Math
add() { echo $(($1 + $2)); }
test_add() { tb_assert_eq "$(add 2 3)" 5; }
test_add_negative() { tb_assert_eq "$(add -2 -3)" -5; }
test_add_wrong() { tb_assert_eq "$(add 2 2)" 5; }
tb_test test_add
tb_test test_add_negative
tb_test test_add_wrong
)sh");
    ASSERT_EQ(tr.total_tests, 3);
    ASSERT_EQ(tr.passed, 2);
    ASSERT_EQ(tr.failed, 1);
    ASSERT_EQ(tr.errors, 0);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "Math.test_add_wrong");
    ASSERT_EQ(tr.failures[0].error_kind, "AssertionError");
    ASSERT_EQ(tr.failures[0].message, "expected '5' but got '4'");
}

// NOLINTNEXTLINE
TEST_F(test_harness_sh, nonzero_exit_of_a_test_is_an_error) {
    auto tr = harness.run(R"(
tb_suite Cmd
test_false() { echo "about to fail"; return 3; }
tb_test test_false
)");
    ASSERT_EQ(tr.total_tests, 1);
    ASSERT_EQ(tr.errors, 1);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "Cmd.test_false");
    ASSERT_EQ(tr.failures[0].error_kind, "NonZeroExit");
    ASSERT_EQ(tr.failures[0].message, "test exited with status 3");
    ASSERT_EQ(tr.failures[0].full_diagnostic, "about to fail");
}

// NOLINTNEXTLINE
TEST_F(test_harness_sh, no_tests) {
    auto tr = harness.run("echo hello\n");
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].error_kind, "NoTestsFound");
}

// NOLINTNEXTLINE
TEST_F(test_harness_sh, declared_suite_without_tests) {
    auto tr = harness.run("tb_suite Empty\necho hello\n");
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_TRUE(tr.success);
    ASSERT_TRUE(tr.failures.empty());
}

// NOLINTNEXTLINE
TEST_F(test_harness_sh, timeout_before_registration) {
    auto tr = harness.run("sleep 5\ntb_test never\n", milliseconds{300});
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "code_execution");
    ASSERT_EQ(tr.failures[0].error_kind, "ExecutionTimeout");
}

// NOLINTNEXTLINE
TEST(test_harness, unrunnable_interpreter) {
    TemporaryDirectory tmp_dir;
    trialbox::language_suite::Sh suite{"/nonexistent/sh"};
    trialbox::ScratchArea scratch{tmp_dir.path()};
    trialbox::Runner runner{
        suite, scratch,
        trialbox::RunLimits{
            .cpu_time = std::chrono::seconds{1},
            .memory_in_bytes = uint64_t{256} << 20,
            .file_size_in_bytes = uint64_t{1} << 20,
        },
        "/usr/bin:/bin"};
    trialbox::TestHarness harness{runner, std::chrono::seconds{1}};
    auto tr = harness.run("tb_test x\n");
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "code_execution");
    ASSERT_EQ(tr.failures[0].error_kind, "std::runtime_error");
    ASSERT_NE(tr.failures[0].message.find("execve(/nonexistent/sh)"), std::string::npos);
    ASSERT_TRUE(tmp_dir.entries().empty());
}
