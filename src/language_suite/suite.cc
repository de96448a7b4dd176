#include "trialbox/language_suite/python.hh"
#include "trialbox/language_suite/sh.hh"
#include "trialbox/language_suite/suite.hh"

namespace trialbox::language_suite {

std::unique_ptr<Suite>
make_suite(std::string_view name, const std::optional<std::string>& interpreter) {
    if (name == "python") {
        return std::make_unique<Python>(interpreter.value_or(Python::default_interpreter));
    }
    if (name == "sh") {
        return std::make_unique<Sh>(interpreter.value_or(Sh::default_interpreter));
    }
    return nullptr;
}

} // namespace trialbox::language_suite
