#include "trialbox/errmsg.hh"
#include "trialbox/file_contents.hh"
#include "trialbox/macros/throw.hh"

#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

size_t write_all(int fd, const void* buf, size_t len) noexcept {
    const auto* data = static_cast<const char*>(buf);
    size_t pos = 0;
    while (pos < len) {
        auto rc = write(fd, data + pos, len - pos);
        if (rc > 0) {
            pos += static_cast<size_t>(rc);
        } else if (rc == 0 or errno != EINTR) {
            return pos;
        }
    }
    errno = 0;
    return pos;
}

size_t pread_all(int fd, off_t pos, void* buf, size_t len) noexcept {
    auto* data = static_cast<char*>(buf);
    size_t done = 0;
    while (done < len) {
        auto rc = pread(fd, data + done, len - done, pos + static_cast<off_t>(done));
        if (rc > 0) {
            done += static_cast<size_t>(rc);
        } else if (rc == 0) {
            errno = 0;
            return done;
        } else if (errno != EINTR) {
            return done;
        }
    }
    errno = 0;
    return done;
}

std::string get_file_contents(int fd) {
    struct stat st {};
    if (fstat(fd, &st)) {
        THROW("fstat()", errmsg());
    }
    std::string res(static_cast<size_t>(st.st_size), '\0');
    auto len = pread_all(fd, 0, res.data(), res.size());
    if (len != res.size() and errno != 0) {
        THROW("pread()", errmsg());
    }
    res.resize(len);
    return res;
}
