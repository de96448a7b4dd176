#pragma once

#include "trialbox/language_suite/fully_interpreted_language.hh"

namespace trialbox::language_suite {

// Tests are unittest.TestCase subclasses
class Python final : public FullyInterpretedLanguage {
public:
    static constexpr auto default_interpreter = "/usr/bin/python3";

    explicit Python(std::string interpreter_executable_path = default_interpreter);

    [[nodiscard]] std::string_view name() const noexcept override { return "python"; }

    [[nodiscard]] std::string_view source_suffix() const noexcept override { return ".py"; }

    [[nodiscard]] std::vector<SafetyRule> blocklist() const override;

    [[nodiscard]] bool defines_tests(std::string_view source) const override;

    [[nodiscard]] std::string test_program(std::string_view source) const override;
};

} // namespace trialbox::language_suite
