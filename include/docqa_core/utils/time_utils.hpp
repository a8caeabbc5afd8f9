#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace docqa_core {

// "YYYY-MM-DD HH:MM:SS", UTC.
std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

// ISO-8601 with a 'T' separator, UTC. Used in JSON records.
std::string to_iso8601(const std::chrono::system_clock::time_point& tp);

// "YYYYmmdd_HHMMSS", local time. Used in backup file names.
std::string compact_timestamp(const std::chrono::system_clock::time_point& tp);

std::chrono::system_clock::time_point file_last_modified(const std::filesystem::path& file_path);

double seconds_since_epoch(const std::chrono::system_clock::time_point& tp);

}  // namespace docqa_core
