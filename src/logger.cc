#include "trialbox/logger.hh"

#include <array>
#include <ctime>
#include <string>

Logger stdlog{stderr};

void Logger::write_line(std::string_view line) {
    std::string buff;
    if (label_) {
        std::array<char, 32> date{};
        time_t now = time(nullptr);
        tm local{};
        if (localtime_r(&now, &local) and
            strftime(date.data(), date.size(), "%Y-%m-%d %H:%M:%S", &local) > 0)
        {
            buff.append("[ ").append(date.data()).append(" ] ");
        }
    }
    buff.append(line);
    buff.push_back('\n');
    // A failing log stream has nowhere to report to
    if (fwrite(buff.data(), 1, buff.size(), stream_) == buff.size()) {
        fflush(stream_);
    }
}
