#include "trialbox/language_suite/python.hh"
#include "trialbox/string_transform.hh"

#include <string_view>

using std::string_view;

namespace {

constexpr string_view source_placeholder = "@SOURCE@";

// Executes the hex-encoded source as module __trialbox_candidate__ (so that a
// `if __name__ == "__main__": unittest.main()` guard stays inactive), announces every
// unittest.TestCase subclass it defines together with its test methods and runs all of them as
// one unittest.TestSuite, so that class and module fixtures take effect. The outcomes are
// reported by the hooks of _TbResult.
constexpr string_view test_driver = R"PY(import sys as _tb_sys
import traceback as _tb_traceback
import types as _tb_types
import unittest as _tb_unittest

_TB_MODULE = "__trialbox_candidate__"


def _tb_emit(*parts):
    words = [" ".join(str(part).split()) for part in parts]
    _tb_sys.stdout.write("\n@trialbox:" + " ".join(word for word in words if word) + "\n")


def _tb_emit_diag(text):
    for line in text.rstrip().split("\n"):
        _tb_sys.stdout.write("@trialbox:diag " + line + "\n")


def _tb_last_line(text):
    lines = [line.strip() for line in text.split("\n") if line.strip()]
    return lines[-1] if lines else ""


def _tb_error_kind(text):
    kind = _tb_last_line(text).split(":")[0].strip()
    return kind if kind and " " not in kind else "Error"


def _tb_test_name(test):
    return type(test).__name__ + "." + test._testMethodName


class _TbResult(_tb_unittest.TestResult):
    def __init__(self, names):
        super().__init__()
        self._pending = list(names)

    def _report(self, name, outcome, *parts, diagnostic=None):
        if name in self._pending:
            self._pending.remove(name)
        else:
            _tb_emit("register", name)
        _tb_emit("result", name, outcome, *parts)
        if diagnostic:
            _tb_emit_diag(diagnostic)
        _tb_sys.stdout.flush()

    def _report_failure(self, name, diagnostic):
        self._report(name, "fail", _tb_last_line(diagnostic), diagnostic=diagnostic)

    def _report_error(self, name, diagnostic):
        self._report(name, "error", _tb_error_kind(diagnostic), _tb_last_line(diagnostic),
                     diagnostic=diagnostic)

    def addSuccess(self, test):
        super().addSuccess(test)
        self._report(_tb_test_name(test), "ok")

    def _affected_by_fixture(self, holder):
        # A class or module fixture, e.g. "setUpClass (__trialbox_candidate__.T)"
        description = str(holder)
        fixture = description.split(" ")[0]
        scope = description[description.find("(") + 1:description.rfind(")")]
        scope = scope[len(_TB_MODULE) + 1:] if scope.startswith(_TB_MODULE + ".") else ""
        affected = [name for name in self._pending
                    if not scope or name.startswith(scope + ".")]
        return affected or [(scope or "module") + "." + fixture]

    def addSkip(self, test, reason):
        super().addSkip(test, reason)
        if isinstance(test, _tb_unittest.TestCase):
            self._report(_tb_test_name(test), "ok")
            return
        for name in self._affected_by_fixture(test):
            self._report(name, "ok")

    def addExpectedFailure(self, test, err):
        super().addExpectedFailure(test, err)
        self._report(_tb_test_name(test), "ok")

    def addUnexpectedSuccess(self, test):
        super().addUnexpectedSuccess(test)
        self._report(_tb_test_name(test), "fail", "Unexpected success",
                     diagnostic="Unexpected success of a test marked as an expected failure")

    def addFailure(self, test, err):
        super().addFailure(test, err)
        self._report_failure(_tb_test_name(test), self.failures[-1][1])

    def addSubTest(self, test, subtest, err):
        super().addSubTest(test, subtest, err)
        if err is None:
            return
        name = _tb_test_name(test)
        if name not in self._pending:
            return  # the first failing subtest decides
        if issubclass(err[0], test.failureException):
            self._report_failure(name, self.failures[-1][1])
        else:
            self._report_error(name, self.errors[-1][1])

    def addError(self, test, err):
        super().addError(test, err)
        diagnostic = self.errors[-1][1]
        if isinstance(test, _tb_unittest.TestCase):
            self._report_error(_tb_test_name(test), diagnostic)
            return
        # The tests that a failed fixture kept from running share its error
        for name in self._affected_by_fixture(test):
            self._report_error(name, diagnostic)


def _tb_run(source):
    module = _tb_types.ModuleType(_TB_MODULE)
    _tb_sys.modules[_TB_MODULE] = module
    try:
        exec(compile(source, "<candidate>", "exec"), module.__dict__)
    except BaseException as error:
        _tb_emit("fault", type(error).__name__, error)
        _tb_emit_diag(_tb_traceback.format_exc())
        return
    loader = _tb_unittest.TestLoader()
    suite = _tb_unittest.TestSuite()
    names = []
    for value in list(module.__dict__.values()):
        if (isinstance(value, type) and issubclass(value, _tb_unittest.TestCase)
                and value.__module__ == _TB_MODULE):
            _tb_emit("suite", value.__name__)
            for method in loader.getTestCaseNames(value):
                names.append(value.__name__ + "." + method)
            suite.addTests(loader.loadTestsFromTestCase(value))
    for name in names:
        _tb_emit("register", name)
    _tb_sys.stdout.flush()
    suite.run(_TbResult(names))


_tb_run(bytes.fromhex("@SOURCE@").decode("utf-8"))
)PY";

} // namespace

namespace trialbox::language_suite {

Python::Python(std::string interpreter_executable_path)
: FullyInterpretedLanguage{
      std::move(interpreter_executable_path),
      {"-I", "-B"}, // isolated mode: ignore PYTHON* variables and the user site directory
      {"LC_ALL=C.UTF-8"}} {}

std::vector<SafetyRule> Python::blocklist() const { return SafetyScanner::default_rules(); }

bool Python::defines_tests(string_view source) const {
    return source.find("unittest.TestCase") != string_view::npos or
        source.find("(TestCase)") != string_view::npos;
}

std::string Python::test_program(string_view source) const {
    std::string program{test_driver};
    program.replace(program.find(source_placeholder), source_placeholder.size(), to_hex(source));
    return program;
}

} // namespace trialbox::language_suite
