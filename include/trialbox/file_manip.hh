#pragma once

#include <string>

// Removes @p path and, if it is a directory, everything inside it. Symbolic links are removed,
// not followed. Returns 0 on success, -1 on error with errno set.
int remove_r(const std::string& path) noexcept;

// Same as remove_r(), but @p name is relative to the directory @p dirfd (or AT_FDCWD)
int remove_r_at(int dirfd, const char* name) noexcept;
