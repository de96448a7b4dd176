#include "sandbox_tracee.hh"
#include "trialbox/errmsg.hh"
#include "trialbox/file_contents.hh"
#include "trialbox/file_descriptor.hh"
#include "trialbox/sandbox.hh"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <linux/securebits.h>
#include <string_view>
#include <sys/capability.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>

using std::string_view;

namespace {

struct Tracee {
    const trialbox::sandbox::Options& options;
    FileDescriptor error_fd;

    template <class... Args>
    // NOLINTNEXTLINE(readability-make-member-function-const)
    [[noreturn]] void die(const Args&... args) noexcept {
        static_assert(sizeof...(Args) > 0, "error message cannot be empty");
        for (auto msg : {string_view{args}...}) {
            if (not msg.empty()) {
                (void)write_all(error_fd, msg);
            }
        }
        _exit(42);
    }

    template <class... Args>
    void die_if_err(bool failed, const Args&... args) noexcept {
        static_assert(
            sizeof...(Args) > 0, "Description of the cause of an error is necessary");
        if (failed) {
            auto err = errmsg();
            die(args..., err);
        }
    }

    void initialize(pid_t parent_pid) noexcept {
        // New process name
        die_if_err(prctl(PR_SET_NAME, "sandbox", 0, 0, 0), "prctl(PR_SET_NAME)");
        // Kill us if the parent dies
        die_if_err(prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0), "prctl(PR_SET_PDEATHSIG)");
        // Ensure the parent did not die before we set PR_SET_PDEATHSIG
        if (getppid() != parent_pid) {
            die("creator of the sandboxed process died");
        }
        // The parent kills the whole process group, so that descendants do not outlive us
        die_if_err(setpgid(0, 0), "setpgid()");
    }

    void redirect(int fd, int target_fd, string_view name) noexcept {
        if (fd < 0) {
            FileDescriptor null_fd{"/dev/null", O_RDWR | O_CLOEXEC};
            die_if_err(not null_fd.is_open(), "open(/dev/null)");
            die_if_err(dup2(null_fd, target_fd) == -1, "dup2(/dev/null -> ", name, ")");
            return;
        }
        if (fd == target_fd) {
            // dup2() would not clear FD_CLOEXEC
            int flags = fcntl(fd, F_GETFD);
            die_if_err(flags == -1, "fcntl(", name, ", F_GETFD)");
            die_if_err(fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC), "fcntl(", name, ", F_SETFD)");
            return;
        }
        die_if_err(dup2(fd, target_fd) == -1, "dup2(", name, ")");
    }

    void setup_io() noexcept {
        redirect(options.new_io_fds.stdin, STDIN_FILENO, "stdin");
        redirect(options.new_io_fds.stdout, STDOUT_FILENO, "stdout");
        redirect(options.new_io_fds.stderr, STDERR_FILENO, "stderr");
    }

    void change_working_directory() noexcept {
        if (options.working_dir) {
            die_if_err(
                chdir(options.working_dir->c_str()), "chdir(", *options.working_dir, ")");
        }
    }

    // Limits above the current hard limit are lowered to it, because only a privileged process
    // may raise the hard limit. A resource unknown to the kernel is skipped.
    void set_limit(int resource, rlim_t soft, rlim_t hard, string_view name) noexcept {
        rlimit old{};
        if (getrlimit(resource, &old)) {
            die_if_err(errno != EINVAL, "getrlimit(", name, ")");
            return;
        }
        rlimit rl = {
            .rlim_cur = std::min(soft, old.rlim_max),
            .rlim_max = std::min(hard, old.rlim_max),
        };
        if (setrlimit(resource, &rl)) {
            die_if_err(errno != EINVAL, "setrlimit(", name, ")");
        }
    }

    void set_limits() noexcept {
        const auto& limits = options.limits;
        if (limits.cpu_time) {
            using std::chrono::seconds;
            auto secs = std::chrono::ceil<seconds>(*limits.cpu_time).count();
            auto soft = static_cast<rlim_t>(std::max<decltype(secs)>(secs, 1));
            set_limit(RLIMIT_CPU, soft, soft + 1, "RLIMIT_CPU");
        }
        if (limits.memory_limit) {
            set_limit(RLIMIT_AS, *limits.memory_limit, *limits.memory_limit, "RLIMIT_AS");
        }
        if (limits.file_size_limit) {
            set_limit(
                RLIMIT_FSIZE, *limits.file_size_limit, *limits.file_size_limit, "RLIMIT_FSIZE");
        }
        if (not limits.allow_core_dumps) {
            set_limit(RLIMIT_CORE, 0, 0, "RLIMIT_CORE");
        }
    }

    void drop_capabilities() noexcept {
        if (not options.drop_capabilities) {
            return;
        }
        if (geteuid() == 0) {
            // Otherwise root would regain all capabilities on execve()
            if (cap_set_secbits(
                    SECBIT_NOROOT | SECBIT_NOROOT_LOCKED | SECBIT_NO_CAP_AMBIENT_RAISE |
                    SECBIT_NO_CAP_AMBIENT_RAISE_LOCKED))
            {
                die_if_err(errno != EPERM, "cap_set_secbits()");
            }
        }
        // Drop all capabilities
        cap_t caps = cap_init();
        die_if_err(caps == nullptr, "cap_init()");
        die_if_err(cap_clear(caps), "cap_clear()");
        die_if_err(cap_set_proc(caps), "cap_set_proc()");
        die_if_err(cap_free(caps), "cap_free()");
        die_if_err(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0), "prctl(PR_SET_NO_NEW_PRIVS)");
    }

    void reset_signals() noexcept {
        // Reset blocked signals
        sigset_t sigset;
        die_if_err(sigemptyset(&sigset), "sigemptyset()");
        die_if_err(sigprocmask(SIG_SETMASK, &sigset, nullptr), "sigprocmask()");
        // Reset SIGPIPE, so that writing to a closed pipe kills the process
        struct sigaction sa {};
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_DFL;
        die_if_err(sigaction(SIGPIPE, &sa, nullptr), "sigaction(SIGPIPE)");
    }

    [[noreturn]] void execute(char* const* argv, char* const* envp) noexcept {
        execve(options.executable.c_str(), argv, envp);
        die_if_err(true, "execve(", options.executable, ")");
        __builtin_unreachable();
    }
};

} // namespace

namespace trialbox::sandbox::tracee {

std::vector<char*> exec_array(const std::vector<std::string>& strs) {
    std::vector<char*> res;
    res.reserve(strs.size() + 1);
    for (const auto& str : strs) {
        res.emplace_back(const_cast<char*>(str.c_str())); // NOLINT(cppcoreguidelines-pro-type-const-cast)
    }
    res.emplace_back(nullptr);
    return res;
}

void execute(
    const Options& options, char* const* argv, char* const* envp, FileDescriptor error_fd,
    pid_t parent_pid) noexcept {
    Tracee tra = {
        .options = options,
        .error_fd = std::move(error_fd),
    };
    tra.initialize(parent_pid);
    tra.setup_io();
    tra.change_working_directory();
    tra.set_limits();
    tra.drop_capabilities();
    tra.reset_signals();
    tra.execute(argv, envp);
}

} // namespace trialbox::sandbox::tracee
