#include "trialbox/string_transform.hh"

std::string_view trim(std::string_view str) noexcept {
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

std::string_view first_line(std::string_view str) noexcept {
    return str.substr(0, str.find('\n'));
}

std::string_view last_significant_line(std::string_view str) noexcept {
    str = trim(str);
    auto pos = str.rfind('\n');
    if (pos == std::string_view::npos) {
        return str;
    }
    return trim(str.substr(pos + 1));
}

std::string to_hex(std::string_view str) {
    constexpr std::string_view digits = "0123456789abcdef";
    std::string res;
    res.reserve(str.size() * 2);
    for (unsigned char c : str) {
        res += digits[c >> 4];
        res += digits[c & 15];
    }
    return res;
}
