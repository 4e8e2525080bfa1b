#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer value for {}: {}", name, value);
    }
    return default_value;
}

double get_env_double(const std::string& name, double default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        spdlog::warn("Invalid double value for {}: {}", name, value);
    }
    return default_value;
}

bool get_env_bool(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    std::string v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    spdlog::warn("Invalid boolean value for {}: {}", name, value);
    return default_value;
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        // Postgres renders timestamps with a space separator
        ss.clear();
        ss.str(iso_string);
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso_string);
        }
    }

    // Timestamps are UTC; timegm avoids the local-time shift of mktime
    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    // Optional fractional seconds
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (!digits.empty()) {
            digits = digits.substr(0, 3);
            while (digits.size() < 3) digits.push_back('0');
            tp += std::chrono::milliseconds(std::stoi(digits));
        }
    }

    // Zone designator: Z, or +HH, +HHMM, +HH:MM (Postgres renders +00)
    int sign = 0;
    if (ss.peek() == 'Z' || ss.peek() == 'z') {
        ss.get();
    } else if (ss.peek() == '+' || ss.peek() == '-') {
        sign = ss.get() == '+' ? 1 : -1;
        std::string digits;
        while (std::isdigit(ss.peek()) || ss.peek() == ':') {
            char c = static_cast<char>(ss.get());
            if (c != ':') digits.push_back(c);
        }
        if (digits.size() != 2 && digits.size() != 4) {
            throw std::runtime_error("Invalid UTC offset in ISO8601 timestamp: " + iso_string);
        }
        int hours = std::stoi(digits.substr(0, 2));
        int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
        if (hours > 23 || minutes > 59) {
            throw std::runtime_error("Invalid UTC offset in ISO8601 timestamp: " + iso_string);
        }
        tp -= std::chrono::minutes(sign * (hours * 60 + minutes));
    }

    ss >> std::ws;
    if (!ss.eof()) {
        throw std::runtime_error("Unexpected trailing characters in ISO8601 timestamp: " + iso_string);
    }

    return tp;
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

double round_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

double clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

} // namespace util
