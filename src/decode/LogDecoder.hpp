#pragma once

#include <string>
#include <vector>

#include "core/Commit.hpp"
#include "decode/DecodeResult.hpp"

namespace gitquery {

/**
 * @brief Decoder for `git log` output in Constants::LOG_FORMAT
 *
 * One commit per line:
 *   hash|authorName|authorEmail|authorEpoch|committerName|committerEmail|committerEpoch|parents|subject|body
 *
 * The line is split into at most ten fields, so '|' inside the body is kept
 * verbatim. '|' inside any earlier field (typically the subject) is not
 * escaped by git and shifts the remaining fields; that record will then
 * usually fail on a timestamp.
 *
 * Policy: lines with fewer than nine fields are skipped; an unparsable
 * timestamp fails the whole decode.
 */
class LogDecoder {
public:
    static DecodeResult<Commit> decodeLine(const std::string& line);

    static Expected<CommitLog> decode(const std::string& output);

    /// Split the %P field into parent hashes (empty field -> no parents)
    static std::vector<Hash> decodeParents(const std::string& field);

    /**
     * @brief Combine one log record with its `git show --stat --format=` report
     *
     * Fails with NotFound when the log output holds no commit. Totals are
     * approximated from the human-readable stat (see StatApproximation).
     */
    static Expected<CommitDetails> decodeDetails(const std::string& logOutput, const std::string& statOutput);
};

}
