#pragma once

#include "trialbox/file_descriptor.hh"
#include "trialbox/sandbox.hh"

#include <string>
#include <vector>

namespace trialbox::sandbox::tracee {

// Returns null-terminated array of pointers to @p strs, as expected by execve(); the pointers
// are valid as long as @p strs is not modified
std::vector<char*> exec_array(const std::vector<std::string>& strs);

// Runs in the cloned child: sets up the process as described by @p options and executes
// options.executable. On error writes the description to @p error_fd and exits.
[[noreturn]] void execute(
    const Options& options, char* const* argv, char* const* envp, FileDescriptor error_fd,
    pid_t parent_pid) noexcept;

} // namespace trialbox::sandbox::tracee
