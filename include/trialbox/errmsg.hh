#pragma once

#include <cerrno>
#include <string>

// Returns " - <errnum>: <description of errnum>", e.g. " - 2: No such file or directory"
std::string errmsg(int errnum = errno);
