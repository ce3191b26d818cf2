#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitquery {

/**
 * @brief Field and line splitting helpers shared by the record decoders
 *
 * All helpers operate on bytes; git output is treated as opaque UTF-8 and
 * never re-encoded.
 */
namespace StringUtils {

/**
 * @brief Split a text blob into lines
 *
 * Splits on '\n' and strips one trailing '\r' per line. A trailing newline
 * does not produce a final empty line; interior empty lines are kept.
 *
 * Example: "a\r\nb\n\nc\n" -> {"a", "b", "", "c"}
 */
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Split on a single-character delimiter into at most maxParts parts
 *
 * The last part receives the unsplit remainder, so an unbounded trailing
 * field is never itself re-split. maxParts == 0 means no cap. Empty fields
 * are kept: "a||b" split on '|' -> {"a", "", "b"}.
 */
std::vector<std::string> splitN(const std::string& text, char delimiter, size_t maxParts = 0);

/// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> splitWhitespace(const std::string& text);

/// Remove leading and trailing whitespace
std::string trim(const std::string& text);

bool startsWith(const std::string& text, const std::string& prefix);
bool contains(const std::string& haystack, const std::string& needle);

/// ASCII lowercase copy
std::string toLower(const std::string& text);

/**
 * @brief Strict decimal integer parsing
 *
 * Accepts an optional leading '-' (signed variant only) followed by one or
 * more digits and nothing else. Returns false on empty input, stray
 * characters or overflow; `out` is untouched on failure.
 */
bool parseInt64(const std::string& text, int64_t& out);
bool parseSize(const std::string& text, size_t& out);

}  // namespace StringUtils

}  // namespace gitquery
