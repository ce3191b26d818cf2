#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Author.hpp"
#include "core/Hash.hpp"
#include "core/RecordCollection.hpp"

namespace gitquery {

/**
 * @brief Commit message split into subject line and optional body
 */
struct CommitMessage {
    std::string subject;
    std::optional<std::string> body;

    /// Subject, then a blank line and the body if present
    std::string full() const;
    bool empty() const { return subject.empty(); }
};

/**
 * @brief One commit decoded from a log record
 *
 * timestamp is always the author timestamp. Parents keep git's order; the
 * first parent is the mainline.
 */
struct Commit {
    Hash hash;
    Author author;
    Author committer;
    CommitMessage message;
    Timestamp timestamp{};
    std::vector<Hash> parents;

    bool isMerge() const { return parents.size() >= 2; }
    bool isRoot() const { return parents.empty(); }
    std::optional<Hash> mainParent() const;

    /// Case-sensitive substring match against author name or email
    bool isAuthoredBy(const std::string& text) const;

    /// Case-insensitive substring match against subject or body
    bool messageContains(const std::string& text) const;

    /// "<short> <subject> by <name> at <YYYY-mm-dd HH:MM:SS UTC>"
    std::string toString() const;
};

/**
 * @brief A commit plus the file-level summary of what it changed
 *
 * insertions/deletions come from an approximated human-stat report (see
 * StatApproximation) and are not exact per file.
 */
struct CommitDetails {
    Commit commit;
    std::vector<std::string> filesChanged;
    size_t insertions{0};
    size_t deletions{0};

    size_t totalChanges() const { return insertions + deletions; }
    bool hasChanges() const { return !filesChanged.empty(); }
};

template <>
struct RecordTraits<Commit> {
    static constexpr bool kSortedByKey = false;
    static const std::string& key(const Commit& commit) { return commit.hash.str(); }
};

using CommitLog = RecordCollection<Commit>;

FilteredView<Commit> byAuthor(const CommitLog& log, const std::string& author);

/// Commits with timestamp >= since
FilteredView<Commit> since(const CommitLog& log, Timestamp since);

/// Commits with timestamp <= until
FilteredView<Commit> until(const CommitLog& log, Timestamp until);

FilteredView<Commit> withMessageContaining(const CommitLog& log, const std::string& text);
FilteredView<Commit> mergesOnly(const CommitLog& log);
FilteredView<Commit> noMerges(const CommitLog& log);

const Commit* findByHash(const CommitLog& log, const Hash& hash);

/// Match on the 7-character display form
const Commit* findByShortHash(const CommitLog& log, const std::string& shortHash);

size_t mergeCount(const CommitLog& log);

}
