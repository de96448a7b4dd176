#pragma once

#include "trialbox/language_suite/suite.hh"

#include <string>
#include <unistd.h>
#include <vector>

namespace trialbox::language_suite {

class FullyInterpretedLanguage : public Suite {
protected:
    std::string interpreter_executable_path;
    std::vector<std::string> interpreter_args; // placed between argv[0] and the source path
    std::vector<std::string> env;

public:
    FullyInterpretedLanguage(
        std::string interpreter_executable_path, std::vector<std::string> interpreter_args,
        std::vector<std::string> env);

    [[nodiscard]] bool is_supported() final {
        return access(interpreter_executable_path.c_str(), X_OK) == 0;
    }

    [[nodiscard]] const std::string& interpreter() const noexcept {
        return interpreter_executable_path;
    }

    [[nodiscard]] sandbox::Options run_options(const std::string& source_path) const final;
};

} // namespace trialbox::language_suite
