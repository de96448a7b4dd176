#include "temporary_directory.hh"

#include <gtest/gtest.h>
#include <trialbox/language_suite/python.hh>
#include <trialbox/runner.hh>
#include <trialbox/scratch_area.hh>
#include <trialbox/test_harness.hh>

using std::chrono::seconds;
using trialbox::TestFailure;

// NOLINTNEXTLINE
TEST(language_suite_python, properties) {
    trialbox::language_suite::Python suite;
    ASSERT_EQ(suite.name(), "python");
    ASSERT_EQ(suite.source_suffix(), ".py");
    ASSERT_EQ(suite.interpreter(), "/usr/bin/python3");
    ASSERT_EQ(suite.blocklist(), trialbox::SafetyScanner::default_rules());
    ASSERT_EQ(suite.program("print(1)\n"), "print(1)\n");
}

// NOLINTNEXTLINE
TEST(language_suite_python, run_options) {
    auto options = trialbox::language_suite::Python{}.run_options("candidate.py");
    ASSERT_EQ(options.executable, "/usr/bin/python3");
    ASSERT_EQ(
        options.args,
        (std::vector<std::string>{"/usr/bin/python3", "-I", "-B", "candidate.py"}));
    ASSERT_EQ(options.env, (std::vector<std::string>{"LC_ALL=C.UTF-8"}));
}

// NOLINTNEXTLINE
TEST(language_suite_python, defines_tests) {
    trialbox::language_suite::Python suite;
    ASSERT_TRUE(suite.defines_tests("import unittest\nclass T(unittest.TestCase):\n    pass\n"));
    ASSERT_TRUE(suite.defines_tests("from unittest import TestCase\nclass T(TestCase):\n  pass\n"));
    ASSERT_FALSE(suite.defines_tests("print('hello')\n"));
}

class language_suite_python_run : public ::testing::Test {
protected:
    TemporaryDirectory tmp_dir;
    trialbox::language_suite::Python suite;
    trialbox::ScratchArea scratch{tmp_dir.path()};
    trialbox::Runner runner{
        suite, scratch,
        trialbox::RunLimits{
            .cpu_time = seconds{5},
            .memory_in_bytes = uint64_t{512} << 20,
            .file_size_in_bytes = uint64_t{1} << 20,
        },
        "/usr/bin:/bin"};
    trialbox::TestHarness harness{runner, seconds{10}};

    void SetUp() override {
        if (not suite.is_supported()) {
            GTEST_SKIP() << "python3 is not available";
        }
    }

    void TearDown() override { EXPECT_TRUE(tmp_dir.entries().empty()); }
};

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, tests_with_failure_and_error) {
    auto tr = harness.run(R"(
import unittest

def add(a, b):
    return a + b

class TestMath(unittest.TestCase):
    def test_add(self):
        self.assertEqual(add(2, 3), 5)

    def test_add_wrong(self):
        self.assertEqual(add(2, 2), 5)

    def test_div(self):
        print("dividing")
        1 / 0

class TestOther(unittest.TestCase):
    def test_ok(self):
        self.assertTrue(True)

if __name__ == "__main__":
    unittest.main()
)");
    ASSERT_EQ(tr.total_tests, 4);
    ASSERT_EQ(tr.passed, 2);
    ASSERT_EQ(tr.failed, 1);
    ASSERT_EQ(tr.errors, 1);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 2);
    ASSERT_EQ(tr.failures[0].test_name, "TestMath.test_add_wrong");
    ASSERT_EQ(tr.failures[0].error_kind, "AssertionError");
    ASSERT_EQ(tr.failures[0].message, "AssertionError: 4 != 5");
    ASSERT_TRUE(tr.failures[0].full_diagnostic.starts_with("Traceback"));
    ASSERT_EQ(tr.failures[1].test_name, "TestMath.test_div");
    ASSERT_EQ(tr.failures[1].error_kind, "ZeroDivisionError");
    ASSERT_EQ(tr.failures[1].message, "ZeroDivisionError: division by zero");
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, all_passed) {
    auto tr = harness.run(R"(
import unittest

class TestStrings(unittest.TestCase):
    def test_upper(self):
        self.assertEqual("abc".upper(), "ABC")

    def test_unicode(self):
        self.assertEqual(len("zażółć"), 6)
)");
    ASSERT_EQ(tr.total_tests, 2);
    ASSERT_EQ(tr.passed, 2);
    ASSERT_TRUE(tr.success);
    ASSERT_TRUE(tr.failures.empty());
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, load_fault) {
    auto tr = harness.run("import unittest\nclass T(unittest.TestCase):\n    pass\nfoo()\n");
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "code_execution");
    ASSERT_EQ(tr.failures[0].error_kind, "NameError");
    ASSERT_EQ(tr.failures[0].message, "name 'foo' is not defined");
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, syntax_error) {
    auto tr = harness.run("import unittest\nclass T(unittest.TestCase)\n    pass\n");
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "code_execution");
    ASSERT_EQ(tr.failures[0].error_kind, "SyntaxError");
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, no_test_cases) {
    auto tr = harness.run("import unittest\nprint('unittest.TestCase')\n");
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_EQ(
        tr.failures,
        (std::vector<TestFailure>{{
            .test_name = "code_structure",
            .error_kind = "NoTestsFound",
            .message = "No test cases found in code",
            .full_diagnostic = "No test cases found in code",
        }}));
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, imported_test_cases_are_not_run) {
    auto tr = harness.run(R"(
import unittest
from unittest import TestCase as Imported

class Mine(unittest.TestCase):
    def test_mine(self):
        pass
)");
    ASSERT_EQ(tr.total_tests, 1);
    ASSERT_TRUE(tr.success);
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, plain_run) {
    auto outcome = runner.run(suite.program("import sys\nprint(sys.flags.isolated)\n"), seconds{10});
    auto er = runner.classify(outcome, seconds{10});
    ASSERT_TRUE(er.success) << er.error;
    ASSERT_EQ(er.output, "1");
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, memory_error) {
    auto outcome = runner.run("x = bytearray(1 << 34)\n", seconds{10});
    auto er = runner.classify(outcome, seconds{10});
    ASSERT_EQ(er.status, trialbox::ExecutionResult::Status::MemoryLimitExceeded) << er.error;
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, class_and_module_fixtures) {
    auto tr = harness.run(R"(
import unittest

state = []

def setUpModule():
    state.append("module")

class TestFixtures(unittest.TestCase):
    @classmethod
    def setUpClass(cls):
        cls.value = 42

    def test_class_fixture(self):
        self.assertEqual(self.value, 42)

    def test_module_fixture(self):
        self.assertEqual(state, ["module"])
)");
    ASSERT_EQ(tr.total_tests, 2);
    ASSERT_EQ(tr.passed, 2);
    ASSERT_TRUE(tr.success);
    ASSERT_TRUE(tr.failures.empty());
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, test_case_without_tests) {
    auto tr = harness.run("import unittest\nclass T(unittest.TestCase):\n    pass\n");
    ASSERT_EQ(tr.total_tests, 0);
    ASSERT_EQ(tr.passed, 0);
    ASSERT_TRUE(tr.success);
    ASSERT_TRUE(tr.failures.empty());
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, expected_failures_and_skips) {
    auto tr = harness.run(R"(
import unittest

class T(unittest.TestCase):
    @unittest.expectedFailure
    def test_broken(self):
        self.assertEqual(1, 2)

    @unittest.expectedFailure
    def test_fixed(self):
        self.assertEqual(1, 1)

    @unittest.skip("not yet")
    def test_skipped(self):
        self.fail("skipped tests do not run")
)");
    ASSERT_EQ(tr.total_tests, 3);
    ASSERT_EQ(tr.passed, 2);
    ASSERT_EQ(tr.failed, 1);
    ASSERT_FALSE(tr.success);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "T.test_fixed");
    ASSERT_EQ(tr.failures[0].error_kind, "AssertionError");
    ASSERT_EQ(tr.failures[0].message, "Unexpected success");
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, failing_class_fixture) {
    auto tr = harness.run(R"(
import unittest

class Broken(unittest.TestCase):
    @classmethod
    def setUpClass(cls):
        raise RuntimeError("no database")

    def test_a(self):
        pass

    def test_b(self):
        pass

class Fine(unittest.TestCase):
    def test_c(self):
        pass
)");
    ASSERT_EQ(tr.total_tests, 3);
    ASSERT_EQ(tr.passed, 1);
    ASSERT_EQ(tr.errors, 2);
    ASSERT_EQ(tr.failures.size(), 2);
    ASSERT_EQ(tr.failures[0].test_name, "Broken.test_a");
    ASSERT_EQ(tr.failures[0].error_kind, "RuntimeError");
    ASSERT_EQ(tr.failures[0].message, "RuntimeError: no database");
    ASSERT_EQ(tr.failures[1].test_name, "Broken.test_b");
}

// NOLINTNEXTLINE
TEST_F(language_suite_python_run, failing_subtest) {
    auto tr = harness.run(R"(
import unittest

class T(unittest.TestCase):
    def test_even(self):
        for i in (2, 3, 5):
            with self.subTest(i=i):
                self.assertEqual(i % 2, 0)
)");
    ASSERT_EQ(tr.total_tests, 1);
    ASSERT_EQ(tr.failed, 1);
    ASSERT_EQ(tr.failures.size(), 1);
    ASSERT_EQ(tr.failures[0].test_name, "T.test_even");
    ASSERT_EQ(tr.failures[0].message, "AssertionError: 1 != 0");
}
