#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>

std::string format_elapsed(Millis d) {
    int64_t ms = d.count();
    if (ms < 0) ms = 0;
    if (ms < 1000) return fmt::format("{}ms", ms);
    if (ms < 60000) return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);

    int64_t secs = ms / 1000;
    if (secs < 3600) return fmt::format("{}m{:02}s", secs / 60, secs % 60);
    return fmt::format("{}h{:02}m", secs / 3600, (secs % 3600) / 60);
}

std::string format_duration(int64_t seconds) {
    if (seconds < 0) return "-";

    int64_t hours = seconds / 3600;
    int64_t mins = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_timestamp(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    struct tm tm_buf = {};
    if (!localtime_r(&t, &tm_buf)) return "?";

    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf) == 0) return "?";
    return std::string(buf);
}
