#include "trialbox/config.hh"
#include "trialbox/errors.hh"
#include "trialbox/language_suite/suite.hh"
#include "trialbox/macros/throw.hh"
#include "trialbox/string_transform.hh"

#include <cstdlib>
#include <string_view>

using std::string_view;

namespace {

std::optional<string_view> env_var(const char* name) noexcept {
    const char* value = std::getenv(name); // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr) {
        return std::nullopt;
    }
    return value;
}

template <class T>
std::optional<T> positive_env_num(const char* name) {
    auto value = env_var(name);
    if (not value) {
        return std::nullopt;
    }
    auto num = str2num<T>(*value);
    if (not num or *num == 0) {
        THROW_AS(
            trialbox::ConfigError, name, ": expected a positive integer, got \"", *value, '"');
    }
    return num;
}

std::optional<std::chrono::nanoseconds> milliseconds_env(const char* name) {
    if (auto ms = positive_env_num<uint64_t>(name)) {
        return std::chrono::milliseconds{*ms};
    }
    return std::nullopt;
}

} // namespace

namespace trialbox {

Config Config::from_env() {
    Config config;
    if (auto language = env_var("TRIALBOX_LANGUAGE")) {
        config.language = *language;
    }
    if (auto interpreter = env_var("TRIALBOX_INTERPRETER")) {
        config.interpreter = *interpreter;
    }
    if (auto timeout = milliseconds_env("TRIALBOX_TIMEOUT_MS")) {
        config.timeout = *timeout;
    }
    if (auto cpu_time_limit = milliseconds_env("TRIALBOX_CPU_TIME_LIMIT_MS")) {
        config.cpu_time_limit = *cpu_time_limit;
    }
    if (auto memory_limit = positive_env_num<uint64_t>("TRIALBOX_MEMORY_LIMIT")) {
        config.memory_limit_in_bytes = *memory_limit;
    }
    if (auto max_file_size = positive_env_num<uint64_t>("TRIALBOX_MAX_FILE_SIZE")) {
        config.max_file_size_in_bytes = *max_file_size;
    }
    if (auto scratch_dir = env_var("TRIALBOX_SCRATCH_DIR")) {
        config.scratch_dir = *scratch_dir;
    }
    if (auto memory_size = positive_env_num<size_t>("TRIALBOX_MEMORY_SIZE")) {
        config.memory_size = *memory_size;
    }
    if (auto path_env = env_var("TRIALBOX_PATH")) {
        config.path_env = *path_env;
    }
    config.validate();
    return config;
}

void Config::validate() const {
    if (not language_suite::make_suite(language, interpreter)) {
        THROW_AS(ConfigError, "unknown language: ", language);
    }
    if (interpreter and interpreter->empty()) {
        THROW_AS(ConfigError, "interpreter path is empty");
    }
    if (timeout <= std::chrono::nanoseconds::zero()) {
        THROW_AS(ConfigError, "timeout has to be positive");
    }
    if (cpu_time_limit <= std::chrono::nanoseconds::zero()) {
        THROW_AS(ConfigError, "CPU time limit has to be positive");
    }
    if (memory_limit_in_bytes == 0) {
        THROW_AS(ConfigError, "memory limit has to be positive");
    }
    if (max_file_size_in_bytes == 0) {
        THROW_AS(ConfigError, "max file size has to be positive");
    }
    if (scratch_dir.empty()) {
        THROW_AS(ConfigError, "scratch directory path is empty");
    }
    if (memory_size == 0) {
        THROW_AS(ConfigError, "memory size has to be positive");
    }
}

} // namespace trialbox
