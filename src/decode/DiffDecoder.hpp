#pragma once

#include <optional>
#include <string>

#include "core/FileDiff.hpp"
#include "util/Expected.hpp"

namespace gitquery {

/// Which `git diff` output shape a blob is in
enum class DiffMode {
    NameOnly,  // --name-only
    NumStat,   // --numstat
    Stat,      // --stat
    Patch      // default unified diff
};

const char* toString(DiffMode mode);

/**
 * @brief Decoder for the four `git diff` output shapes
 *
 * All modes skip lines they cannot interpret. Stats are summed from the
 * per-file records except in Stat mode, where the summary line is
 * authoritative (falling back to the number of file lines).
 */
class DiffDecoder {
public:
    static Expected<DiffOutput> decode(const std::string& output, DiffMode mode);

    /// One path per non-empty line; all Modified with no counts
    static Expected<DiffOutput> decodeNameOnly(const std::string& output);

    /**
     * @brief "<additions>\t<deletions>\t<path>" per line
     *
     * Binary files report "-\t-" and are flagged binary with zero counts.
     * Status is inferred: only additions -> Added, only deletions ->
     * Deleted, otherwise Modified.
     */
    static Expected<DiffOutput> decodeNumstat(const std::string& output);

    /// Human-readable stat: " path | N +++--" lines plus a summary line
    static Expected<DiffOutput> decodeStat(const std::string& output);

    /// Full unified diff with hunks, renames, copies and binary markers
    static Expected<DiffOutput> decodePatch(const std::string& output);

    /**
     * @brief Parse "N file(s) changed[, A insertion(s)(+)][, D deletion(s)(-)]"
     *
     * Returns nullopt when the line is not a summary line. Missing parts
     * read as zero.
     */
    static std::optional<DiffStats> parseStatSummary(const std::string& line);
};

}
