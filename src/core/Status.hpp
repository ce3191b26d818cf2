#pragma once

#include <optional>
#include <string>

#include "core/RecordCollection.hpp"

namespace gitquery {

/// State of a path in the staging area (first porcelain column)
enum class IndexStatus { Clean, Modified, Added, Deleted, Renamed, Copied };

/// State of a path in the working tree (second porcelain column)
enum class WorktreeStatus { Clean, Modified, Deleted, Untracked, Ignored };

/// Map a porcelain code character; unrecognized characters give Clean
IndexStatus indexStatusFromChar(char c);
WorktreeStatus worktreeStatusFromChar(char c);

/// Inverse of the *FromChar mapping; Clean renders as ' '
char toChar(IndexStatus status);
char toChar(WorktreeStatus status);

const char* toString(IndexStatus status);
const char* toString(WorktreeStatus status);

/**
 * @brief One changed path from `git status --porcelain`
 *
 * Never constructed by the decoder when both axes are Clean.
 * originalPath is set for renames and copies reported as "old -> new".
 */
struct StatusEntry {
    std::string path;
    std::optional<std::string> originalPath;
    IndexStatus indexStatus{IndexStatus::Clean};
    WorktreeStatus worktreeStatus{WorktreeStatus::Clean};

    bool isStaged() const { return indexStatus != IndexStatus::Clean; }
    bool isUnstaged() const { return worktreeStatus != WorktreeStatus::Clean; }
    bool isUntracked() const { return worktreeStatus == WorktreeStatus::Untracked; }
    bool isIgnored() const { return worktreeStatus == WorktreeStatus::Ignored; }

    /// Two-character porcelain code, e.g. "M " or "??"
    std::string code() const;
};

template <>
struct RecordTraits<StatusEntry> {
    static constexpr bool kSortedByKey = false;
    static const std::string& key(const StatusEntry& entry) { return entry.path; }
};

using StatusReport = RecordCollection<StatusEntry>;

/// True when the report has no entries
bool isClean(const StatusReport& report);
bool hasChanges(const StatusReport& report);

FilteredView<StatusEntry> stagedFiles(const StatusReport& report);
FilteredView<StatusEntry> unstagedFiles(const StatusReport& report);
FilteredView<StatusEntry> untrackedFiles(const StatusReport& report);
FilteredView<StatusEntry> ignoredFiles(const StatusReport& report);
FilteredView<StatusEntry> filesWithIndexStatus(const StatusReport& report, IndexStatus status);
FilteredView<StatusEntry> filesWithWorktreeStatus(const StatusReport& report, WorktreeStatus status);

}
