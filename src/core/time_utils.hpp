#pragma once

#include <string>
#include <ctime>

// Format the age of an ISO timestamp (YYYY-MM-DDTHH:MM:SS) relative to `now`
// (current time when 0). Returns "just now", "14m ago", "3h ago", "5d ago",
// "-" if the timestamp is empty, or "?" on parse failure.
std::string format_age(const std::string& iso_time, std::time_t now = 0);

// Format an ISO timestamp as "2025-01-15 14:35". "-" if empty, "?" on parse failure.
std::string format_date(const std::string& iso_time);
