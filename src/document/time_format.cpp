#include "document/time_format.hpp"

#include <cmath>
#include <ctime>
#include <format>

std::string format_clock(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) seconds = 0;
    auto total = static_cast<long long>(seconds);
    long long h = total / 3600;
    long long m = (total % 3600) / 60;
    long long s = total % 60;
    if (h > 0) return std::format("{:02}:{:02}:{:02}", h, m, s);
    return std::format("{:02}:{:02}", m, s);
}

std::string format_srt_time(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) seconds = 0;
    auto ms = static_cast<long long>(std::llround(seconds * 1000.0));
    return std::format("{:02}:{:02}:{:02},{:03}",
                       ms / 3600000, (ms / 60000) % 60, (ms / 1000) % 60, ms % 1000);
}

std::string format_estimate(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) seconds = 0;
    if (seconds < 60) return std::format("~{} seconds", static_cast<int>(seconds));
    if (seconds < 3600) return std::format("~{} minutes", static_cast<int>(seconds / 60));
    return std::format("~{:.1f} hours", seconds / 3600);
}

std::string format_local_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%d/%m/%Y %H:%M", &tm);
    return buf;
}
