#include "trialbox/concat_tostr.hh"
#include "trialbox/debug.hh"
#include "trialbox/errmsg.hh"
#include "trialbox/file_contents.hh"
#include "trialbox/file_descriptor.hh"
#include "trialbox/macros/throw.hh"
#include "trialbox/runner.hh"
#include "trialbox/string_transform.hh"

#include <array>
#include <csignal>
#include <optional>
#include <sys/mman.h>
#include <sys/wait.h>

using std::chrono::nanoseconds;
using std::string_view;

namespace {

constexpr DebugLogger<debug_logs_enabled, false> debuglog{};

constexpr std::array out_of_memory_markers = {
    string_view{"MemoryError"},
    string_view{"std::bad_alloc"},
    string_view{"Cannot allocate memory"},
    string_view{"Out of memory"},
};

// Signal that ended the process; a shell reports the signal that killed its child as exit status
// 128 + signal number
std::optional<int> ending_signal(const trialbox::sandbox::Si& si) noexcept {
    if (si.code == CLD_KILLED or si.code == CLD_DUMPED) {
        return si.status;
    }
    if (si.code == CLD_EXITED) {
        switch (si.status - 128) {
        case SIGKILL:
        case SIGXCPU:
        case SIGXFSZ: return si.status - 128;
        default: break;
        }
    }
    return std::nullopt;
}

FileDescriptor capture_fd(const char* name) {
    FileDescriptor fd{memfd_create(name, MFD_CLOEXEC)};
    if (not fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    return fd;
}

} // namespace

namespace trialbox {

RunOutcome Runner::run(string_view program, nanoseconds timeout) {
    // On exceptions the destructor of ScratchDir removes the directory
    auto file_name = concat_tostr("candidate", suite_.source_suffix());
    auto run_dir = scratch_.materialize(program, file_name);

    auto stdout_fd = capture_fd("stdout");
    auto stderr_fd = capture_fd("stderr");
    // The working directory is the run directory, so the relative path is used
    auto options = suite_.run_options(file_name);
    options.env.emplace_back(concat_tostr("PATH=", path_env_));
    options.working_dir = run_dir.path();
    options.new_io_fds = {
        .stdin = -1,
        .stdout = stdout_fd,
        .stderr = stderr_fd,
    };
    options.limits = {
        .real_time = timeout,
        .cpu_time = limits_.cpu_time,
        .memory_limit = limits_.memory_in_bytes,
        .file_size_limit = limits_.file_size_in_bytes,
        .allow_core_dumps = false,
    };

    auto res = sandbox::execute(options).get();
    debuglog(
        "runner: ", run_dir.path(), ' ', res.si.description(), " in ", seconds_str(res.runtime),
        " s (cpu: ", seconds_str(res.cpu_runtime), " s, rss: ", res.max_rss, " B)");
    RunOutcome outcome = {
        .result = res,
        .stdout_contents = get_file_contents(stdout_fd),
        .stderr_contents = get_file_contents(stderr_fd),
    };
    scratch_.release(std::move(run_dir));
    return outcome;
}

ExecutionResult Runner::classify(const RunOutcome& outcome, nanoseconds timeout) const {
    using enum ExecutionResult::Status;
    const auto& res = outcome.result;
    ExecutionResult er = {
        .status = Ok,
        .success = false,
        .output = std::string{trim(outcome.stdout_contents)},
        .error = std::string{trim(outcome.stderr_contents)},
        .execution_time = res.runtime,
        .test_result = std::nullopt,
    };

    if (res.real_time_limit_exceeded) {
        er.status = ExecutionTimeout;
        er.output.clear();
        er.error = concat_tostr("Execution timed out after ", seconds_str(timeout), " seconds");
        er.execution_time = timeout;
        return er;
    }

    if (auto sig = ending_signal(res.si)) {
        switch (*sig) {
        case SIGXCPU:
            er.status = CpuLimitExceeded;
            er.error = concat_tostr(
                "CPU time limit of ", seconds_str(limits_.cpu_time), " seconds exceeded");
            return er;
        case SIGXFSZ:
            er.status = FileSizeLimitExceeded;
            er.error = concat_tostr(
                "File size limit of ", limits_.file_size_in_bytes, " bytes exceeded");
            return er;
        case SIGKILL:
            if (res.cpu_runtime >= limits_.cpu_time) {
                er.status = CpuLimitExceeded;
                er.error = concat_tostr(
                    "CPU time limit of ", seconds_str(limits_.cpu_time), " seconds exceeded");
            } else {
                er.status = ResourceLimitExceeded;
                er.error = concat_tostr("Process ", res.si.description());
            }
            return er;
        default: break;
        }
    }

    if (res.si == sandbox::Si{.code = CLD_EXITED, .status = 0}) {
        er.success = true;
        return er;
    }

    er.status = RuntimeFault;
    for (auto marker : out_of_memory_markers) {
        if (er.error.find(marker) != std::string::npos) {
            er.status = MemoryLimitExceeded;
            break;
        }
    }
    if (er.error.empty()) {
        er.error = concat_tostr("Process ", res.si.description());
    }
    return er;
}

std::optional<string_view> fault_kind_from_stderr(string_view stderr_contents) noexcept {
    auto line = last_significant_line(stderr_contents);
    auto colon = line.find(':');
    if (colon == 0 or colon == string_view::npos) {
        return std::nullopt;
    }
    auto kind = line.substr(0, colon);
    for (char c : kind) {
        bool ok = (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
            c == '_' or c == '.';
        if (not ok) {
            return std::nullopt;
        }
    }
    return kind;
}

std::string seconds_str(nanoseconds dur) {
    return concat_tostr(std::chrono::duration<double>{dur}.count());
}

} // namespace trialbox
