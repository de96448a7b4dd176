#pragma once

#include "trialbox/safety_scanner.hh"
#include "trialbox/sandbox.hh"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialbox::language_suite {

// A language suite interface
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class Suite {
public:
    Suite() = default;

    Suite(const Suite&) = delete;
    Suite(Suite&&) noexcept = default;
    Suite& operator=(const Suite&) = delete;
    Suite& operator=(Suite&&) = delete;

    virtual ~Suite() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual bool is_supported() = 0;

    // Suffix of source file names, e.g. ".py"
    [[nodiscard]] virtual std::string_view source_suffix() const noexcept = 0;

    // Ordered rules for the SafetyScanner
    [[nodiscard]] virtual std::vector<SafetyRule> blocklist() const = 0;

    // Whether @p source declares test cases
    [[nodiscard]] virtual bool defines_tests(std::string_view source) const = 0;

    // Returns the program that runs @p source as is
    [[nodiscard]] virtual std::string program(std::string_view source) const {
        return std::string{source};
    }

    // Returns a program that runs the test cases declared in @p source and prints the test
    // report in the format parsed by parse_report() (see test_harness.hh)
    [[nodiscard]] virtual std::string test_program(std::string_view source) const = 0;

    // Returns options that run the program stored in @p source_path; only executable, args and
    // env are filled
    [[nodiscard]] virtual sandbox::Options run_options(const std::string& source_path) const = 0;
};

// Returns the suite named @p name ("python" or "sh"), using @p interpreter instead of the
// default interpreter if set; returns nullptr for an unknown name
std::unique_ptr<Suite>
make_suite(std::string_view name, const std::optional<std::string>& interpreter);

} // namespace trialbox::language_suite
