#pragma once

#include <string>
#include <cstdint>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Interpret a y/n answer. Empty or unrecognised input yields no_match_default.
bool parse_yes_no(const std::string& answer, bool no_match_default);

// Human-readable byte count: "512 B", "3.4 KiB", "1.2 GiB".
std::string format_bytes(int64_t bytes);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
