#pragma once

#include "trialbox/language_suite/fully_interpreted_language.hh"

namespace trialbox::language_suite {

// POSIX shell. Tests are functions registered with "tb_test <function>" under the suite named
// by the last "tb_suite <name>"; assertions: tb_assert_eq <actual> <expected>, tb_fail <message>.
class Sh final : public FullyInterpretedLanguage {
public:
    static constexpr auto default_interpreter = "/bin/sh";

    explicit Sh(std::string interpreter_executable_path = default_interpreter);

    [[nodiscard]] std::string_view name() const noexcept override { return "sh"; }

    [[nodiscard]] std::string_view source_suffix() const noexcept override { return ".sh"; }

    [[nodiscard]] std::vector<SafetyRule> blocklist() const override;

    [[nodiscard]] bool defines_tests(std::string_view source) const override;

    // The test helpers are defined, so that the code runs outside of the tests as well
    [[nodiscard]] std::string program(std::string_view source) const override;

    [[nodiscard]] std::string test_program(std::string_view source) const override;
};

} // namespace trialbox::language_suite
