#pragma once

#include <sstream>
#include <string>
#include <utility>

// Concatenates textual representations of @p args; each of them has to be printable to
// std::ostream
template <class... Args>
std::string concat_tostr(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return std::move(oss).str();
}
