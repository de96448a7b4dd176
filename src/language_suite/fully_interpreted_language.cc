#include "trialbox/language_suite/fully_interpreted_language.hh"

namespace trialbox::language_suite {

FullyInterpretedLanguage::FullyInterpretedLanguage(
    std::string interpreter_executable_path, std::vector<std::string> interpreter_args,
    std::vector<std::string> env)
: interpreter_executable_path{std::move(interpreter_executable_path)}
, interpreter_args{std::move(interpreter_args)}
, env{std::move(env)} {}

sandbox::Options FullyInterpretedLanguage::run_options(const std::string& source_path) const {
    sandbox::Options options;
    options.executable = interpreter_executable_path;
    options.args.emplace_back(interpreter_executable_path);
    options.args.insert(options.args.end(), interpreter_args.begin(), interpreter_args.end());
    options.args.emplace_back(source_path);
    options.env = env;
    return options;
}

} // namespace trialbox::language_suite
