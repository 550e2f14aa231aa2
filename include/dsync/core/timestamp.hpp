#pragma once

/**
 * @file timestamp.hpp
 * @brief Timezone-stripped ("naive") timestamps used by the diff engine
 *
 * The remote reports ISO-8601 times with an offset, the local filesystem
 * reports mtimes that we read as local wall-clock time. Both sides are
 * reduced to microseconds of their wall-clock fields with the offset
 * dropped, so "2024-01-02T00:00:00Z" and a local "2024-01-02 00:00:00"
 * compare equal.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dsync {

using NaiveMicros = std::int64_t;

/**
 * @brief Wall-clock fields to microseconds since 1970-01-01 00:00:00 (no timezone)
 */
NaiveMicros naive_from_fields(int year, unsigned month, unsigned day,
                              int hour, int minute, int second,
                              std::int64_t micros = 0);

/**
 * @brief Parse "YYYY-MM-DD[T| ]HH:MM:SS[.frac][Z|+HH:MM|-HHMM]" ignoring the offset
 *
 * @return nullopt on any malformed input
 */
std::optional<NaiveMicros> parse_iso8601_naive(const std::string& text);

/**
 * @brief Local mtime of a file as naive local wall-clock time
 */
std::optional<NaiveMicros> local_mtime_naive(const std::filesystem::path& path);

std::string format_naive(NaiveMicros value);

} // namespace dsync
