/**
 * @file time_utils.hpp
 * @brief Timestamp formatting and parsing helpers.
 */

#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <optional>
#include <string>

using Clock = std::chrono::system_clock;

/// "2026-10-19T03:00:00Z"
std::string formatIso8601(Clock::time_point time);

/// "20261019_030000", UTC.
std::string formatCompactTimestamp(Clock::time_point time);

/// "2026-10-19 05:00:00", local time, as used in log lines.
std::string formatLocalTime(Clock::time_point time);

/**
 * @brief Parses an ISO-8601 UTC timestamp with optional fractional seconds.
 *
 * Accepts "2026-10-19T03:00:00Z" and "2026-10-19T03:00:00.000Z".
 */
std::optional<Clock::time_point> parseIso8601(const std::string& text);

/**
 * @brief Converts an ISO-8601 timestamp to the compact key form.
 *
 * "2026-10-19T03:00:00Z" becomes "20261019_030000": dashes and colons are
 * dropped, 'T' becomes '_', and fractional seconds and the zone are cut.
 */
std::string compactIsoTimestamp(const std::string& iso);

#endif // TIME_UTILS_HPP
