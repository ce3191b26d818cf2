#include "decode/StashDecoder.hpp"

#include <vector>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"
#include "util/TimeUtils.hpp"

namespace gitquery {

Expected<Stash> StashDecoder::decodeLine(size_t index, const std::string& line) {
    std::vector<std::string> parts = StringUtils::splitN(line, ' ', Constants::STASH_FIELDS);
    if (parts.size() < Constants::STASH_FIELDS) {
        return Error{ErrorCode::MalformedRecord,
                     "Invalid stash list format: expected " + std::to_string(Constants::STASH_FIELDS) +
                         " parts, got " + std::to_string(parts.size())};
    }

    const std::string& remainder = parts[3];
    if (remainder.empty()) {
        return Error{ErrorCode::MalformedRecord, "Invalid stash format: missing branch and message information"};
    }

    Stash stash;
    stash.index = index;
    stash.hash = Hash(parts[1]);

    auto when = TimeUtils::parseEpochSeconds(parts[2]);
    if (when) {
        stash.timestamp = when.value();
    } else {
        Logger::instance().debug("stash: " + when.error().message + ", using epoch");
        stash.timestamp = TimeUtils::epochStart();
    }

    size_t colon = remainder.find(':');
    if (colon == std::string::npos) {
        stash.branch = Constants::UNKNOWN_BRANCH;
        stash.message = remainder;
        return stash;
    }

    const std::string label = remainder.substr(0, colon);
    if (StringUtils::startsWith(label, "On ")) {
        stash.branch = label.substr(3);
    } else if (StringUtils::startsWith(label, "WIP on ")) {
        stash.branch = label.substr(7);
    } else {
        stash.branch = Constants::UNKNOWN_BRANCH;
    }
    stash.message = StringUtils::trim(remainder.substr(colon + 1));
    return stash;
}

Expected<StashList> StashDecoder::decode(const std::string& output) {
    std::vector<Stash> stashes;
    for (const std::string& raw : StringUtils::splitLines(output)) {
        const std::string line = StringUtils::trim(raw);
        if (line.empty()) continue;
        auto stash = decodeLine(stashes.size(), line);
        if (!stash) {
            return stash.error();
        }
        stashes.push_back(stash.take());
    }
    return StashList(std::move(stashes));
}

}
