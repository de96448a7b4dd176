#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace trialbox {

struct Config {
    std::string language = "python"; // name of the language suite
    std::optional<std::string> interpreter; // if unset, the suite's default interpreter is used
    std::chrono::nanoseconds timeout = std::chrono::seconds{10}; // wall-clock limit of a run
    std::chrono::nanoseconds cpu_time_limit = std::chrono::seconds{5};
    uint64_t memory_limit_in_bytes = uint64_t{256} << 20;
    uint64_t max_file_size_in_bytes = uint64_t{10} << 20;
    std::string scratch_dir = "/tmp/trialbox";
    size_t memory_size = 5; // capacity of the attempt memory
    std::string path_env = "/usr/local/bin:/usr/bin:/bin"; // PATH of the sandboxed process

    // Defaults overridden by the TRIALBOX_* environment variables (durations in milliseconds,
    // sizes in bytes); throws ConfigError on an invalid value
    [[nodiscard]] static Config from_env();

    // Throws ConfigError if the configuration is unusable
    void validate() const;
};

} // namespace trialbox
