#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace host_audit {
namespace utils {

// Strip trailing spaces, tabs, CR and LF.
std::string trim_right(const std::string& s);

// Split on runs of whitespace; leading/trailing whitespace yields no empty fields.
std::vector<std::string> split_whitespace(const std::string& s);

// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& s);

// Join argv with single spaces for diagnostics (not for execution).
std::string join_args(const std::vector<std::string>& argv);

// strftime over local time.
std::string format_local_time(std::chrono::system_clock::time_point tp, const char* fmt);

} // namespace utils
} // namespace host_audit
