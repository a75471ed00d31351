#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

// Format a time_point to an ISO8601 string
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// Parse an ISO8601 string to a time_point, applying any zone offset;
// throws std::runtime_error on malformed input
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);

// Read a numeric field, treating absent, null, non-numeric and non-finite values as missing
std::optional<double> json_finite_number(const nlohmann::json& j, const char* key);

// Read a timestamp field, falling back when absent or malformed
std::chrono::system_clock::time_point json_time_or(
    const nlohmann::json& j, const char* key, std::chrono::system_clock::time_point fallback);

// Value or 0.0 when not finite
double finite_or_zero(double value);
