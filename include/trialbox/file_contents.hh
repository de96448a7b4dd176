#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <sys/types.h>

// Writes the whole buffer retrying on EINTR and partial writes. Returns the number of bytes
// written; if it is lower than @p len, errno describes the error.
size_t write_all(int fd, const void* buf, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads from position @p pos until the buffer is full. Returns the number of bytes read; if it
// is lower than @p len, errno is 0 on reaching the end of file, or describes the error.
size_t pread_all(int fd, off_t pos, void* buf, size_t len) noexcept;

// Reads the whole file from the beginning, the file offset is not changed; throws on error
std::string get_file_contents(int fd);
