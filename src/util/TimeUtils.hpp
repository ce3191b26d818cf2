#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "util/Expected.hpp"

namespace gitquery {

/// Calendar timestamp at one-second resolution, always interpreted as UTC
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

namespace TimeUtils {

/**
 * @brief Parse a decimal epoch-seconds field (git's %at, %ct, ...)
 *
 * Fails with ErrorCode::InvalidTimestamp if the text is not a signed 64-bit
 * integer ("Invalid timestamp: <text>") or if the value has no calendar
 * date the C library can represent ("Invalid timestamp value: <n>").
 */
Expected<Timestamp> parseEpochSeconds(const std::string& text);

/// Unix epoch start (1970-01-01T00:00:00Z); sentinel for corrupt metadata
Timestamp epochStart();

Timestamp fromEpochSeconds(int64_t seconds);
int64_t toEpochSeconds(const Timestamp& ts);

/**
 * @brief Format a timestamp in UTC with strftime syntax
 *
 * Example: formatUtc(fromEpochSeconds(0)) -> "1970-01-01 00:00:00 UTC"
 */
std::string formatUtc(const Timestamp& ts, const char* format = "%Y-%m-%d %H:%M:%S UTC");

}  // namespace TimeUtils

}  // namespace gitquery
