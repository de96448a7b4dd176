#pragma once

#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

// Owning wrapper of a file descriptor; closes it on destruction
class FileDescriptor {
    int fd_ = -1;

public:
    FileDescriptor() noexcept = default;

    // NOLINTNEXTLINE(google-explicit-constructor)
    FileDescriptor(int fd) noexcept
    : fd_{fd} {}

    FileDescriptor(const char* path, int flags, mode_t mode = S_IRUSR | S_IWUSR) noexcept
    : fd_{::open(path, flags, mode)} {}

    FileDescriptor(const std::string& path, int flags, mode_t mode = S_IRUSR | S_IWUSR) noexcept
    : FileDescriptor{path.c_str(), flags, mode} {}

    FileDescriptor(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept
    : fd_{std::exchange(other.fd_, -1)} {}

    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            (void)close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    FileDescriptor& operator=(int fd) noexcept {
        (void)close();
        fd_ = fd;
        return *this;
    }

    ~FileDescriptor() { (void)close(); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    // Returns the file descriptor and stops owning it
    int release() noexcept { return std::exchange(fd_, -1); }

    // Returns 0 on success, -1 on error (errno is set); the descriptor is released either way
    int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        return ::close(std::exchange(fd_, -1));
    }
};
