#include "trialbox/language_suite/sh.hh"

#include <string_view>

using std::string_view;

namespace {

constexpr string_view test_prelude = R"SH(_tb_suite=main
_tb_suites=
_tb_tests=
tb_suite() {
    _tb_suite=$1
    _tb_suites="$_tb_suites $1"
}
tb_test() {
    _tb_tests="$_tb_tests $_tb_suite.$1"
}
tb_fail() {
    printf '%s\n' "$*"
    exit 86
}
tb_assert_eq() {
    [ "$1" = "$2" ] || tb_fail "expected '$2' but got '$1'"
}
)SH";

// Every test function runs in a subshell; status 86 means a failed assertion
constexpr string_view test_runner = R"SH(
for _tb_name in $_tb_suites; do
    printf '\n@trialbox:suite %s\n' "$_tb_name"
done
for _tb_name in $_tb_tests; do
    printf '\n@trialbox:register %s\n' "$_tb_name"
done
for _tb_name in $_tb_tests; do
    _tb_output=$( ("${_tb_name##*.}") 2>&1 )
    _tb_status=$?
    _tb_last=
    while IFS= read -r _tb_line; do
        case $_tb_line in
            *[![:space:]]*) _tb_last=$_tb_line ;;
        esac
    done <<_TB_EOF
$_tb_output
_TB_EOF
    if [ "$_tb_status" -eq 0 ]; then
        printf '\n@trialbox:result %s ok\n' "$_tb_name"
    elif [ "$_tb_status" -eq 86 ]; then
        printf '\n@trialbox:result %s fail %s\n' "$_tb_name" "$_tb_last"
    else
        printf '\n@trialbox:result %s error NonZeroExit test exited with status %s\n' \
            "$_tb_name" "$_tb_status"
    fi
    if [ -n "$_tb_output" ]; then
        printf '%s\n' "$_tb_output" | while IFS= read -r _tb_line; do
            printf '@trialbox:diag %s\n' "$_tb_line"
        done
    fi
done
)SH";

} // namespace

namespace trialbox::language_suite {

Sh::Sh(std::string interpreter_executable_path)
: FullyInterpretedLanguage{std::move(interpreter_executable_path), {}, {}} {}

std::vector<SafetyRule> Sh::blocklist() const {
    return {
        {"rm ", "file deletion"},
        {"rmdir", "directory deletion"},
        {"mv ", "filesystem manipulation"},
        {"chmod", "filesystem manipulation"},
        {"eval ", "dynamic code evaluation"},
        {"exec ", "dynamic code execution"},
        {"source ", "dynamic code execution"},
        {"nohup", "process spawning"},
        {"setsid", "process spawning"},
        {"tee ", "file system access"},
        {"dd if=", "file system access"},
        {"curl", "network access"},
        {"wget", "network access"},
        {"/dev/tcp", "network access"},
        {"nc ", "network access"},
    };
}

bool Sh::defines_tests(string_view source) const {
    return source.find("tb_test ") != string_view::npos;
}

std::string Sh::program(string_view source) const {
    std::string res;
    res.reserve(test_prelude.size() + source.size());
    res.append(test_prelude).append(source);
    return res;
}

std::string Sh::test_program(string_view source) const {
    auto res = program(source);
    res.append("\n").append(test_runner);
    return res;
}

} // namespace trialbox::language_suite
