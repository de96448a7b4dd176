#include "sandbox_tracee.hh"
#include "syscalls.hh"
#include "trialbox/concat_tostr.hh"
#include "trialbox/debug.hh"
#include "trialbox/errmsg.hh"
#include "trialbox/file_contents.hh"
#include "trialbox/file_descriptor.hh"
#include "trialbox/macros/throw.hh"
#include "trialbox/sandbox.hh"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <linux/sched.h>
#include <poll.h>
#include <string>
#include <sys/mman.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using std::chrono::steady_clock;

namespace {

constexpr DebugLogger<debug_logs_enabled, false> debuglog{};

std::chrono::nanoseconds to_nanoseconds(timeval tv) noexcept {
    return std::chrono::seconds{tv.tv_sec} + std::chrono::microseconds{tv.tv_usec};
}

} // namespace

namespace trialbox::sandbox {

[[nodiscard]] std::string Si::description() const {
    auto signal_description = [](const char* prefix, int signum) {
        auto abbrv = sigabbrev_np(signum);
        auto descr = sigdescr_np(signum);
        if (abbrv) {
            if (descr) {
                return concat_tostr(prefix, ' ', abbrv, " - ", descr);
            }
            return concat_tostr(prefix, ' ', abbrv);
        }
        if (descr) {
            return concat_tostr(prefix, " with number ", signum, " - ", descr);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return signal_description("killed by signal", status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", status);
    case CLD_TRAPPED: return signal_description("trapped by signal", status);
    case CLD_STOPPED: return signal_description("stopped by signal", status);
    case CLD_CONTINUED: return signal_description("continued by signal", status);
    }
    return "unable to describe";
}

future execute(const Options& options) {
    FileDescriptor error_fd{memfd_create("sandbox errors", MFD_CLOEXEC)};
    if (not error_fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    // Everything that allocates is prepared before clone3()
    auto argv = tracee::exec_array(options.args);
    auto envp = tracee::exec_array(options.env);
    auto parent_pid = getpid();

    int child_pidfd{};
    clone_args cl_args = {
        .flags = CLONE_PIDFD,
        .pidfd = reinterpret_cast<uintptr_t>(&child_pidfd),
        .exit_signal = SIGCHLD,
    };
    auto start_time = steady_clock::now();
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        THROW("clone3()", errmsg());
    }
    if (pid == 0) {
        tracee::execute(options, argv.data(), envp.data(), std::move(error_fd), parent_pid);
        __builtin_unreachable();
    }
    // Parent process
    debuglog("sandbox: spawned [", pid, "] ", options.executable);
    return {pid, FileDescriptor{child_pidfd}, std::move(error_fd), start_time,
            options.limits.real_time};
}

Result future::get() {
    if (not pidfd.is_open()) {
        THROW("future already retrieved");
    }
    Result res{};
    if (real_time_limit) {
        auto deadline = start_time + *real_time_limit;
        for (;;) {
            auto remaining = deadline - steady_clock::now();
            if (remaining <= steady_clock::duration::zero()) {
                debuglog("sandbox: real time limit expired, killing [", pid, "]");
                if (syscalls::pidfd_send_signal(pidfd, SIGKILL, nullptr, 0) and errno != ESRCH)
                {
                    THROW("pidfd_send_signal(KILL)", errmsg());
                }
                res.real_time_limit_exceeded = true;
                break;
            }
            pollfd pfd = {
                .fd = pidfd,
                .events = POLLIN,
                .revents = 0,
            };
            auto timeout_ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
            int rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
            if (rc == -1) {
                if (errno == EINTR) {
                    continue;
                }
                THROW("poll()", errmsg());
            }
            if (rc > 0) {
                break; // the process has exited
            }
        }
    }

    siginfo_t si{};
    // WNOWAIT keeps the process group alive, so that it can be killed before the process is
    // reaped and its pid reused
    if (syscalls::waitid(P_PIDFD, pidfd, &si, WEXITED | WNOWAIT, nullptr)) {
        THROW("waitid()", errmsg());
    }
    res.runtime = steady_clock::now() - start_time;
    if (kill(-pid, SIGKILL) and errno != ESRCH) {
        THROW("kill(process group)", errmsg());
    }
    rusage ru{};
    if (syscalls::waitid(P_PIDFD, pidfd, &si, WEXITED, &ru)) {
        THROW("waitid()", errmsg());
    }
    (void)pidfd.close();
    debuglog(
        "sandbox: [", pid, "] ", Si{.code = si.si_code, .status = si.si_status}.description());

    // Receive an error of the tracee, if any
    off_t pos = lseek(error_fd, 0, SEEK_CUR);
    if (pos == -1) {
        THROW("lseek()", errmsg());
    }
    if (pos > 0) {
        std::string msg(pos, '\0');
        if (pread_all(error_fd, 0, msg.data(), msg.size()) != msg.size()) {
            THROW("read()", errmsg());
        }
        THROW(msg);
    }
    (void)error_fd.close(); // Not needed anymore

    res.si = {
        .code = si.si_code,
        .status = si.si_status,
    };
    res.cpu_runtime = to_nanoseconds(ru.ru_utime) + to_nanoseconds(ru.ru_stime);
    res.max_rss = static_cast<uint64_t>(ru.ru_maxrss) * 1024;
    return res;
}

future::~future() {
    if (pidfd.is_open()) {
        // The result was not retrieved, do not leave the processes behind
        (void)syscalls::pidfd_send_signal(pidfd, SIGKILL, nullptr, 0);
        (void)kill(-pid, SIGKILL);
        siginfo_t si;
        (void)syscalls::waitid(P_PIDFD, pidfd, &si, WEXITED, nullptr);
    }
}

} // namespace trialbox::sandbox
