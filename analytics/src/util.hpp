#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool contains(const std::string& haystack, const std::string& needle);

// Time utilities
std::string current_iso8601();
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// Math utilities
double round_to(double value, int decimals);
double clamp(double value, double lo, double hi);

} // namespace util
