#include "decode/StatusDecoder.hpp"

#include <vector>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace gitquery {

DecodeResult<StatusEntry> StatusDecoder::decodeLine(const std::string& line) {
    if (line.size() < Constants::STATUS_MIN_LINE) {
        return skipped<StatusEntry>();
    }

    StatusEntry entry;
    entry.indexStatus = indexStatusFromChar(line[0]);
    entry.worktreeStatus = worktreeStatusFromChar(line[1]);
    if (entry.indexStatus == IndexStatus::Clean && entry.worktreeStatus == WorktreeStatus::Clean) {
        return skipped<StatusEntry>();
    }

    entry.path = line.substr(Constants::STATUS_PATH_OFFSET);
    if (entry.indexStatus == IndexStatus::Renamed || entry.indexStatus == IndexStatus::Copied) {
        size_t arrow = entry.path.find(Constants::STATUS_RENAME_ARROW);
        if (arrow != std::string::npos) {
            entry.originalPath = entry.path.substr(0, arrow);
            entry.path = entry.path.substr(arrow + std::string(Constants::STATUS_RENAME_ARROW).size());
        }
    }
    return decoded(std::move(entry));
}

Expected<StatusReport> StatusDecoder::decode(const std::string& output) {
    std::vector<StatusEntry> entries;
    for (const std::string& line : StringUtils::splitLines(output)) {
        auto result = decodeLine(line);
        if (result.value()) {
            entries.push_back(std::move(*result.value()));
        } else if (!line.empty()) {
            Logger::instance().debug("status: skipping line '" + line + "'");
        }
    }
    return StatusReport(std::move(entries));
}

}
