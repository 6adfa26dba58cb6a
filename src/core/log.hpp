#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string rprov_log_path() {
    static std::string path = (platform::temp_dir() / "rprov_debug.log").string();
    return path;
}

// Append a timestamped line to the debug log. Safe to call from prober
// worker threads.
inline void rprov_log(const std::string& msg) {
    static std::mutex log_mutex;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(rprov_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

