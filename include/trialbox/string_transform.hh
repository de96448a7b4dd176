#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

[[nodiscard]] constexpr bool is_space(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\v' or c == '\f';
}

// Strips leading and trailing whitespace
[[nodiscard]] std::string_view trim(std::string_view str) noexcept;

// Returns the text before the first '\n' (the whole text if there is none)
[[nodiscard]] std::string_view first_line(std::string_view str) noexcept;

// Returns the last line that is not blank, trimmed; empty if there is none
[[nodiscard]] std::string_view last_significant_line(std::string_view str) noexcept;

// Returns @p str truncated to at most @p max_len bytes
[[nodiscard]] constexpr std::string_view truncated(std::string_view str, size_t max_len) noexcept {
    return str.substr(0, max_len);
}

// Parses the whole @p str as a decimal number
template <class T>
[[nodiscard]] std::optional<T> str2num(std::string_view str) noexcept {
    static_assert(std::is_integral_v<T>);
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

// Returns lowercase hexadecimal representation of the bytes of @p str
[[nodiscard]] std::string to_hex(std::string_view str);
