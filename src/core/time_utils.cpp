#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <sstream>
#include <iomanip>

static bool parse_iso(const std::string& s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    out->tm_isdst = -1;
    return !ss.fail();
}

std::string format_age(const std::string& iso_time, std::time_t now) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf = {};
    if (!parse_iso(iso_time, &tm_buf)) {
        return "?";
    }
    std::time_t then = mktime(&tm_buf);
    if (now == 0) now = std::time(nullptr);

    long seconds = static_cast<long>(std::difftime(now, then));
    if (seconds < 60) return "just now";

    long mins = seconds / 60;
    long hours = mins / 60;
    long days = hours / 24;

    if (days > 0) {
        return fmt::format("{}d ago", days);
    } else if (hours > 0) {
        return fmt::format("{}h ago", hours);
    } else {
        return fmt::format("{}m ago", mins);
    }
}

std::string format_date(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf = {};
    if (!parse_iso(iso_time, &tm_buf)) {
        return "?";
    }

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return std::string(buf);
}
