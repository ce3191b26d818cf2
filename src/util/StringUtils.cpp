#include "util/StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <stdexcept>

namespace gitquery {
namespace StringUtils {

static bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool allDigits(const std::string& text, size_t from) {
    if (from >= text.size()) return false;
    return std::all_of(text.begin() + static_cast<std::ptrdiff_t>(from), text.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

std::vector<std::string> splitN(const std::string& text, char delimiter, size_t maxParts) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        if (maxParts != 0 && parts.size() + 1 == maxParts) {
            parts.push_back(text.substr(start));
            break;
        }
        size_t pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isSpace(text[i])) ++i;
        size_t start = i;
        while (i < text.size() && !isSpace(text[i])) ++i;
        if (i > start) tokens.push_back(text.substr(start, i - start));
    }
    return tokens;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && isSpace(text[begin])) ++begin;
    size_t end = text.size();
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string toLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return out;
}

bool parseInt64(const std::string& text, int64_t& out) {
    size_t digitsFrom = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (!allDigits(text, digitsFrom)) return false;
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed, 10);
        if (consumed != text.size()) return false;
        out = static_cast<int64_t>(value);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

bool parseSize(const std::string& text, size_t& out) {
    if (!allDigits(text, 0)) return false;
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed, 10);
        if (consumed != text.size()) return false;
        out = static_cast<size_t>(value);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

}  // namespace StringUtils
}  // namespace gitquery
