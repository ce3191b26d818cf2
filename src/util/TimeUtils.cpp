#include "util/TimeUtils.hpp"

#include <ctime>

#include "util/StringUtils.hpp"

namespace gitquery {
namespace TimeUtils {

using std::chrono::seconds;

// Broken-down UTC time; false when the year does not fit std::tm
static bool toUtcParts(int64_t secs, std::tm& parts) {
    std::time_t t = static_cast<std::time_t>(secs);
    if (static_cast<int64_t>(t) != secs) return false;
#if defined(_WIN32)
    return gmtime_s(&parts, &t) == 0;
#else
    return gmtime_r(&t, &parts) != nullptr;
#endif
}

Expected<Timestamp> parseEpochSeconds(const std::string& text) {
    int64_t value = 0;
    if (!StringUtils::parseInt64(text, value)) {
        return Error{ErrorCode::InvalidTimestamp, "Invalid timestamp: " + text};
    }
    std::tm parts{};
    if (!toUtcParts(value, parts)) {
        return Error{ErrorCode::InvalidTimestamp, "Invalid timestamp value: " + std::to_string(value)};
    }
    return fromEpochSeconds(value);
}

Timestamp epochStart() {
    return Timestamp{};
}

Timestamp fromEpochSeconds(int64_t secs) {
    return Timestamp{seconds{secs}};
}

int64_t toEpochSeconds(const Timestamp& ts) {
    return static_cast<int64_t>(ts.time_since_epoch().count());
}

std::string formatUtc(const Timestamp& ts, const char* format) {
    std::tm parts{};
    if (!toUtcParts(toEpochSeconds(ts), parts)) {
        return std::to_string(toEpochSeconds(ts));
    }
    char buffer[80];
    size_t n = std::strftime(buffer, sizeof(buffer), format, &parts);
    return std::string(buffer, n);
}

}  // namespace TimeUtils
}  // namespace gitquery
