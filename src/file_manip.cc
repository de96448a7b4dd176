#include "trialbox/file_manip.hh"

#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>

namespace {

int open_dir_at(int dirfd, const char* name) noexcept {
    constexpr int flags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;
    int fd = openat(dirfd, name, flags);
    if (fd == -1 and errno == EACCES) {
        // The owner may have taken away its own permissions to the directory
        if (fchmodat(dirfd, name, S_IRWXU, 0)) {
            return -1;
        }
        fd = openat(dirfd, name, flags);
    }
    return fd;
}

int remove_dir_contents_at(int dirfd, const char* name) noexcept {
    int fd = open_dir_at(dirfd, name);
    if (fd == -1) {
        return -1;
    }
    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        int err = errno;
        (void)close(fd);
        errno = err;
        return -1;
    }
    int rc = 0;
    for (;;) {
        errno = 0;
        auto* entry = readdir(dir);
        if (entry == nullptr) {
            if (errno != 0) {
                rc = -1;
            }
            break;
        }
        std::string_view entry_name = entry->d_name;
        if (entry_name == "." or entry_name == "..") {
            continue;
        }
        if (remove_r_at(fd, entry->d_name)) {
            rc = -1;
            break;
        }
    }
    int err = errno;
    (void)closedir(dir); // closes fd
    errno = err;
    return rc;
}

} // namespace

int remove_r_at(int dirfd, const char* name) noexcept {
    if (unlinkat(dirfd, name, 0) == 0) {
        return 0;
    }
    if (errno != EISDIR) {
        return -1;
    }
    if (remove_dir_contents_at(dirfd, name)) {
        return -1;
    }
    return unlinkat(dirfd, name, AT_REMOVEDIR);
}

int remove_r(const std::string& path) noexcept { return remove_r_at(AT_FDCWD, path.c_str()); }
