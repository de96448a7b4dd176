#include "trialbox/errmsg.hh"
#include "trialbox/errors.hh"
#include "trialbox/evaluator.hh"
#include "trialbox/file_contents.hh"
#include "trialbox/file_descriptor.hh"
#include "trialbox/logger.hh"
#include "trialbox/macros/throw.hh"
#include "trialbox/runner.hh"

#include <cerrno>
#include <cstdio>
#include <exception>
#include <fcntl.h>
#include <string>
#include <string_view>
#include <unistd.h>

using std::string;
using std::string_view;

namespace {

constexpr int exit_failure = 1;
constexpr int exit_usage = 2;

void print_usage(const char* program) {
    fprintf(
        stderr,
        "Usage: %s [--tests] <file|->\n"
        "Evaluates the code from the file (or stdin for \"-\") in the sandbox.\n"
        "  --tests  only run the test cases of the code\n"
        "Configuration is read from the TRIALBOX_* environment variables.\n",
        program);
}

string read_stdin() {
    string res;
    char buff[1 << 16];
    for (;;) {
        auto len = read(STDIN_FILENO, buff, sizeof(buff));
        if (len == 0) {
            return res;
        }
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read(stdin)", errmsg());
        }
        res.append(buff, static_cast<size_t>(len));
    }
}

string read_code(const string& path) {
    if (path == "-") {
        return read_stdin();
    }
    FileDescriptor fd{path, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open(", path, ")", errmsg());
    }
    return get_file_contents(fd);
}

void print_section(string_view name, string_view contents) {
    if (not contents.empty()) {
        printf("%.*s:\n%.*s\n", static_cast<int>(name.size()), name.data(),
               static_cast<int>(contents.size()), contents.data());
    }
}

void print_test_result(const trialbox::TestResult& tr) {
    printf(
        "tests: %d/%d passed, %d failed, %d errors\n", tr.passed, tr.total_tests, tr.failed,
        tr.errors);
    for (const auto& failure : tr.failures) {
        printf(
            "FAILED %s (%s)\n%s\n", failure.test_name.c_str(), failure.error_kind.c_str(),
            failure.full_diagnostic.c_str());
    }
}

int evaluate(trialbox::Evaluator& evaluator, const string& code) {
    auto er = evaluator.evaluate(code);
    auto status = trialbox::to_string(er.status);
    printf("status: %.*s\n", static_cast<int>(status.size()), status.data());
    printf("time: %s s\n", trialbox::seconds_str(er.execution_time).c_str());
    print_section("output", er.output);
    print_section("error", er.error);
    return er.success ? 0 : exit_failure;
}

int run_tests(trialbox::Evaluator& evaluator, const string& code) {
    auto tr = evaluator.run_tests(code);
    print_test_result(tr);
    return tr.success ? 0 : exit_failure;
}

} // namespace

int main(int argc, char** argv) {
    bool tests_only = false;
    const char* path = nullptr;
    for (int i = 1; i < argc; ++i) {
        string_view arg = argv[i];
        if (arg == "--tests") {
            tests_only = true;
        } else if (arg == "-h" or arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (path == nullptr and (arg == "-" or not arg.starts_with('-'))) {
            path = argv[i];
        } else {
            print_usage(argv[0]);
            return exit_usage;
        }
    }
    if (path == nullptr) {
        print_usage(argv[0]);
        return exit_usage;
    }

    stdlog.label(false);
    try {
        auto code = read_code(path);
        trialbox::Evaluator evaluator{trialbox::Config::from_env()};
        return tests_only ? run_tests(evaluator, code) : evaluate(evaluator, code);
    } catch (const trialbox::ConfigError& e) {
        stdlog("configuration error: ", e.what());
        return exit_usage;
    } catch (const std::exception& e) {
        stdlog("error: ", e.what());
        return exit_failure;
    }
}
