#include "util.hpp"
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        tt -= 1;
    }

    std::tm tm = {};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::stringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::runtime_error("Malformed ISO8601 timestamp: " + iso_string);
    }

    // Handle fractional seconds, normalised to milliseconds
    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        int digits = 0;
        while (std::isdigit(ss.peek())) {
            int d = ss.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + d;
            }
            ++digits;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    // Zone designator: none or 'Z' is UTC, otherwise +HH:MM, +HHMM or +HH
    std::chrono::minutes offset(0);
    std::string zone;
    std::getline(ss, zone);
    if (!zone.empty() && zone != "Z" && zone != "z") {
        if (zone[0] != '+' && zone[0] != '-') {
            throw std::runtime_error("Malformed ISO8601 zone designator: " + iso_string);
        }
        std::string digits;
        for (size_t i = 1; i < zone.size(); ++i) {
            if (std::isdigit(static_cast<unsigned char>(zone[i]))) {
                digits += zone[i];
            } else if (!(zone[i] == ':' && i == 3)) {
                throw std::runtime_error("Malformed ISO8601 zone designator: " + iso_string);
            }
        }
        if (digits.size() != 2 && digits.size() != 4) {
            throw std::runtime_error("Malformed ISO8601 zone designator: " + iso_string);
        }
        int hours = std::stoi(digits.substr(0, 2));
        int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
        if (hours > 23 || minutes > 59) {
            throw std::runtime_error("ISO8601 zone offset out of range: " + iso_string);
        }
        offset = std::chrono::minutes(hours * 60 + minutes);
        if (zone[0] == '-') {
            offset = -offset;
        }
    }

    auto time = std::chrono::system_clock::from_time_t(timegm(&tm));
    return time + std::chrono::milliseconds(millis) - offset;
}

std::optional<double> json_finite_number(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::chrono::system_clock::time_point json_time_or(
    const nlohmann::json& j, const char* key, std::chrono::system_clock::time_point fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    try {
        return parse_iso8601(it->get<std::string>());
    } catch (const std::runtime_error&) {
        return fallback;
    }
}

double finite_or_zero(double value) {
    return std::isfinite(value) ? value : 0.0;
}
