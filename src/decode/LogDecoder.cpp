#include "decode/LogDecoder.hpp"

#include "core/Constants.hpp"
#include "decode/StatApproximation.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"
#include "util/TimeUtils.hpp"

namespace gitquery {

namespace {
    // Field positions within one LOG_FORMAT record
    constexpr size_t kHashField = 0;
    constexpr size_t kAuthorName = 1;
    constexpr size_t kAuthorEmail = 2;
    constexpr size_t kAuthorEpoch = 3;
    constexpr size_t kCommitterName = 4;
    constexpr size_t kCommitterEmail = 5;
    constexpr size_t kCommitterEpoch = 6;
    constexpr size_t kParents = 7;
    constexpr size_t kSubject = 8;
    constexpr size_t kBody = 9;
}

std::vector<Hash> LogDecoder::decodeParents(const std::string& field) {
    std::vector<Hash> parents;
    for (const std::string& token : StringUtils::splitWhitespace(field)) {
        parents.emplace_back(token);
    }
    return parents;
}

DecodeResult<Commit> LogDecoder::decodeLine(const std::string& rawLine) {
    const std::string line = StringUtils::trim(rawLine);
    if (line.empty()) {
        return skipped<Commit>();
    }

    std::vector<std::string> parts =
        StringUtils::splitN(line, Constants::LOG_FIELD_DELIMITER, Constants::LOG_MAX_FIELDS);
    if (parts.size() < Constants::LOG_MIN_FIELDS) {
        Logger::instance().debug("log: skipping record with " + std::to_string(parts.size()) + " fields");
        return skipped<Commit>();
    }

    auto authorTime = TimeUtils::parseEpochSeconds(parts[kAuthorEpoch]);
    if (!authorTime) return authorTime.error();
    auto committerTime = TimeUtils::parseEpochSeconds(parts[kCommitterEpoch]);
    if (!committerTime) return committerTime.error();

    Commit commit;
    commit.hash = Hash(parts[kHashField]);
    commit.author = Author{parts[kAuthorName], parts[kAuthorEmail], authorTime.value()};
    commit.committer = Author{parts[kCommitterName], parts[kCommitterEmail], committerTime.value()};
    commit.parents = decodeParents(parts[kParents]);
    commit.message.subject = parts[kSubject];
    if (parts.size() > kBody && !parts[kBody].empty()) {
        commit.message.body = parts[kBody];
    }
    commit.timestamp = authorTime.value();
    return decoded(std::move(commit));
}

Expected<CommitLog> LogDecoder::decode(const std::string& output) {
    std::vector<Commit> commits;
    for (const std::string& line : StringUtils::splitLines(output)) {
        auto result = decodeLine(line);
        if (!result) {
            return result.error();
        }
        if (result.value()) {
            commits.push_back(std::move(*result.value()));
        }
    }
    return CommitLog(std::move(commits));
}

Expected<CommitDetails> LogDecoder::decodeDetails(const std::string& logOutput, const std::string& statOutput) {
    auto log = decode(logOutput);
    if (!log) return log.error();
    if (log.value().empty()) {
        return Error{ErrorCode::NotFound, "Commit not found"};
    }

    StatTotals totals = StatApproximation::approximateStatTotals(statOutput);
    CommitDetails details;
    details.commit = *log.value().first();
    details.filesChanged = std::move(totals.files);
    details.insertions = totals.insertions;
    details.deletions = totals.deletions;
    return details;
}

}
