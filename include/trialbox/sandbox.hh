#pragma once

#include "trialbox/file_descriptor.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

namespace trialbox::sandbox {

struct Options {
    struct NewIOFileDescriptors {
        int stdin = STDIN_FILENO; // if negative, use /dev/null
        int stdout = STDOUT_FILENO; // if negative, use /dev/null
        int stderr = STDERR_FILENO; // if negative, use /dev/null
    } new_io_fds;

    struct Limits {
        // Real time limit of the process; enforced by future::get() independently of the other
        // limits, on expiry the process and its process group are killed
        std::optional<std::chrono::nanoseconds> real_time;
        // CPU time limit, rounded up to whole seconds; SIGXCPU is delivered at the limit and
        // SIGKILL one second later
        std::optional<std::chrono::nanoseconds> cpu_time;
        // Limits total virtual memory size (in bytes)
        std::optional<uint64_t> memory_limit;
        // Maximum size (in bytes) of a file the process may write, including captured output
        std::optional<uint64_t> file_size_limit;
        bool allow_core_dumps = false;
    } limits;

    std::string executable; // path to program to run
    std::vector<std::string> args; // executable args (same as for execve())
    std::vector<std::string> env; // the whole environment, entries have form "NAME=value"
    std::optional<std::string> working_dir; // if not set, the working directory is inherited
    // Drop all capabilities and set no_new_privs before running the executable
    bool drop_capabilities = true;
};

struct Si {
    int code; // siginfo_t::si_code from waitid()
    int status; // siginfo_t::si_status from waitid()

    bool operator==(const Si&) const noexcept = default;

    // Returns textual description, e.g. "exited with 1" or "killed by signal KILL - Killed"
    [[nodiscard]] std::string description() const;
};

struct Result {
    Si si{};
    // Runtime (real time) of the process
    std::chrono::nanoseconds runtime{0};
    // Total CPU time of the process and its waited descendants
    std::chrono::nanoseconds cpu_runtime{0};
    // Peak resident set size (in bytes)
    uint64_t max_rss = 0;
    // Whether the process was killed because the real time limit expired
    bool real_time_limit_exceeded = false;
};

class future {
    pid_t pid;
    FileDescriptor pidfd;
    FileDescriptor error_fd;
    std::chrono::steady_clock::time_point start_time;
    std::optional<std::chrono::nanoseconds> real_time_limit;

    future(
        pid_t pid, FileDescriptor pidfd, FileDescriptor error_fd,
        std::chrono::steady_clock::time_point start_time,
        std::optional<std::chrono::nanoseconds> real_time_limit) noexcept
    : pid{pid}
    , pidfd{std::move(pidfd)}
    , error_fd{std::move(error_fd)}
    , start_time{start_time}
    , real_time_limit{real_time_limit} {}

public:
    future(const future&) = delete;
    future(future&&) noexcept = default;
    future& operator=(const future&) = delete;
    future& operator=(future&&) noexcept = default;

    // Not retrieved future kills the process group and reaps the process
    ~future();

    // Waits for the process (at most the real time limit) and retrieves the result. Throws an
    // instance of std::runtime_error on error, including errors that prevented the executable
    // from starting.
    Result get();

    friend future execute(const Options& options);
};

// Spawns the process described by @p options; throws on error
future execute(const Options& options);

} // namespace trialbox::sandbox
