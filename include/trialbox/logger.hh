#pragma once

#include "trialbox/concat_tostr.hh"

#include <cstdio>
#include <string_view>

// Writes time-stamped lines to a stream
class Logger {
    FILE* stream_;
    bool label_ = true;

    void write_line(std::string_view line);

public:
    explicit Logger(FILE* stream) noexcept
    : stream_{stream} {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;
    ~Logger() = default;

    // nullptr disables logging
    void use(FILE* stream) noexcept { stream_ = stream; }

    // Whether to prefix lines with the date and time
    void label(bool enabled) noexcept { label_ = enabled; }

    [[nodiscard]] bool is_enabled() const noexcept { return stream_ != nullptr; }

    template <class... Args>
    void operator()(Args&&... args) {
        if (stream_) {
            write_line(concat_tostr(std::forward<Args>(args)...));
        }
    }
};

// By default writes to stderr
extern Logger stdlog;
