#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/RecordCollection.hpp"

namespace gitquery {

enum class DiffStatus { Added, Modified, Deleted, Renamed, Copied };

/// 'A' 'M' 'D' 'R' 'C'; nullopt for anything else
std::optional<DiffStatus> diffStatusFromChar(char c);
char toChar(DiffStatus status);
const char* toString(DiffStatus status);

/// Parse "added", "modified", ... (as printed by toString) or a single status letter
std::optional<DiffStatus> diffStatusFromName(const std::string& name);

enum class DiffLineType { Context, Added, Removed };

/// ' ' '+' '-'; nullopt for anything else
std::optional<DiffLineType> diffLineTypeFromChar(char c);
char toChar(DiffLineType type);

struct DiffLine {
    DiffLineType type{DiffLineType::Context};
    std::string content;
};

/// One "@@ -oldStart,oldCount +newStart,newCount @@" hunk
struct DiffChunk {
    size_t oldStart{0};
    size_t oldCount{0};
    size_t newStart{0};
    size_t newCount{0};
    std::vector<DiffLine> lines;
};

/**
 * @brief Per-file change record
 *
 * Chunks are only present when decoded from a full patch. additions and
 * deletions are exact for numstat and patch input and zero for name-only
 * and human-stat input.
 */
struct FileDiff {
    std::string path;
    std::optional<std::string> oldPath;
    DiffStatus status{DiffStatus::Modified};
    std::vector<DiffChunk> chunks;
    size_t additions{0};
    size_t deletions{0};
    bool binary{false};

    bool isBinary() const { return binary; }

    /// Counts are known but no hunk detail was decoded
    bool isSummaryOnly() const { return chunks.empty() && (additions > 0 || deletions > 0); }

    /// "<status> <path>" or "<status> <old> -> <path>"
    std::string toString() const;
};

/**
 * @brief Aggregate counts for one diff
 */
struct DiffStats {
    size_t filesChanged{0};
    size_t insertions{0};
    size_t deletions{0};

    void addFile(size_t additions, size_t deletions);

    /// "N files changed, A insertions(+), D deletions(-)"
    std::string toString() const;
};

template <>
struct RecordTraits<FileDiff> {
    static constexpr bool kSortedByKey = false;
    static const std::string& key(const FileDiff& diff) { return diff.path; }
};

using DiffReport = RecordCollection<FileDiff>;

/// Decoded diff: per-file records plus the aggregate line
struct DiffOutput {
    DiffReport files;
    DiffStats stats;
};

FilteredView<FileDiff> filesWithStatus(const DiffReport& report, DiffStatus status);

/// Sum per-file counts into a DiffStats
DiffStats summarize(const DiffReport& report);

}
