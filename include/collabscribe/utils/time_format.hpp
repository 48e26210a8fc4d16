#pragma once

#include <chrono>
#include <string>

namespace collabscribe {
namespace utils {

/**
 * Truncate a wall-clock time point to millisecond precision.
 */
std::chrono::system_clock::time_point truncateToMillis(std::chrono::system_clock::time_point tp);

/**
 * ISO-8601 UTC with milliseconds: "2026-10-17T09:41:05.123Z"
 */
std::string formatIso8601(std::chrono::system_clock::time_point tp);

/**
 * Parse the format produced by formatIso8601. Fractional seconds and the
 * trailing 'Z' are optional. Returns false on malformed input.
 */
bool parseIso8601(const std::string& text, std::chrono::system_clock::time_point& out);

/**
 * "mm:ss" with minutes not wrapped at 60; seconds truncated.
 */
std::string formatMinutesSeconds(double seconds);

/**
 * "HH:MM:SS,mmm" (SubRip) or "HH:MM:SS.mmm" (WebVTT), rounded to the nearest millisecond.
 */
std::string formatSrtTimestamp(double seconds);
std::string formatVttTimestamp(double seconds);

} // namespace utils
} // namespace collabscribe
