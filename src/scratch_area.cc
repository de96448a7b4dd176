#include "trialbox/debug.hh"
#include "trialbox/errmsg.hh"
#include "trialbox/errors.hh"
#include "trialbox/file_contents.hh"
#include "trialbox/file_descriptor.hh"
#include "trialbox/file_manip.hh"
#include "trialbox/macros/throw.hh"
#include "trialbox/scratch_area.hh"

#include <cerrno>
#include <cstdlib>
#include <exception>
#include <fcntl.h>
#include <sys/stat.h>

namespace {

constexpr DebugLogger<debug_logs_enabled, true> debuglog{};

} // namespace

namespace trialbox {

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        if (exists()) {
            (void)remove_r(path_);
        }
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

ScratchDir::~ScratchDir() {
    if (exists()) {
        (void)remove_r(path_);
    }
}

void ScratchDir::remove() {
    if (exists()) {
        if (remove_r(path_)) {
            THROW("remove_r(", path_, ")", errmsg());
        }
        path_.clear();
    }
}

ScratchArea::ScratchArea(std::string dir)
: dir_{std::move(dir)} {
    while (dir_.size() > 1 and dir_.back() == '/') {
        dir_.pop_back();
    }
    if (dir_.empty()) {
        THROW_AS(ScratchAreaError, "scratch directory path is empty");
    }
    if (mkdir(dir_.c_str(), S_IRWXU) and errno != EEXIST) {
        THROW_AS(ScratchAreaError, "mkdir(", dir_, ")", errmsg());
    }
    struct stat st {};
    if (stat(dir_.c_str(), &st)) {
        THROW_AS(ScratchAreaError, "stat(", dir_, ")", errmsg());
    }
    if (not S_ISDIR(st.st_mode)) {
        THROW_AS(ScratchAreaError, "scratch area ", dir_, " is not a directory");
    }
    debuglog("scratch area: ", dir_);
}

ScratchDir ScratchArea::materialize(std::string_view contents, std::string_view file_name) {
    auto templ = concat_tostr(dir_, "/run.XXXXXX");
    if (mkdtemp(templ.data()) == nullptr) {
        THROW_AS(ScratchAreaError, "mkdtemp(", templ, ")", errmsg());
    }
    ScratchDir run_dir{std::move(templ)};

    auto path = concat_tostr(run_dir.path(), '/', file_name);
    FileDescriptor fd{path, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW_AS(ScratchAreaError, "open(", path, ")", errmsg());
    }
    if (write_all(fd, contents) != contents.size()) {
        THROW_AS(ScratchAreaError, "write(", path, ")", errmsg());
    }
    if (fd.close()) {
        THROW_AS(ScratchAreaError, "close(", path, ")", errmsg());
    }
    debuglog.verbose("scratch area: created ", path);
    return run_dir;
}

void ScratchArea::release(ScratchDir&& dir) {
    auto path = dir.path();
    try {
        dir.remove();
    } catch (const std::exception& e) {
        THROW_AS(ScratchAreaError, "cannot clean the scratch area: ", e.what());
    }
    debuglog.verbose("scratch area: removed ", path);
}

} // namespace trialbox
