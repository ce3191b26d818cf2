#pragma once

#include <optional>
#include <string>

#include "core/Hash.hpp"
#include "core/RecordCollection.hpp"

namespace gitquery {

enum class BranchType { Local, RemoteTracking };

const char* toString(BranchType type);

/**
 * @brief One branch from `git branch -vv --all`
 *
 * Remote-tracking names are stored without the "remotes/" prefix, e.g.
 * "origin/main". upstream is the tracked ref ("origin/main") when reported.
 */
struct Branch {
    std::string name;
    BranchType type{BranchType::Local};
    bool isCurrent{false};
    Hash commitHash;
    std::optional<std::string> upstream;

    bool isLocal() const { return type == BranchType::Local; }
    bool isRemote() const { return type == BranchType::RemoteTracking; }

    /// Name without the leading remote segment ("origin/feature/x" -> "feature/x")
    std::string shortName() const;

    /// "* name" for the current branch, "  name" otherwise
    std::string toString() const;
};

template <>
struct RecordTraits<Branch> {
    static constexpr bool kSortedByKey = true;
    static const std::string& key(const Branch& branch) { return branch.name; }
};

using BranchList = RecordCollection<Branch>;

FilteredView<Branch> localBranches(const BranchList& branches);
FilteredView<Branch> remoteBranches(const BranchList& branches);
const Branch* currentBranch(const BranchList& branches);
const Branch* findByShortName(const BranchList& branches, const std::string& shortName);
size_t localCount(const BranchList& branches);
size_t remoteCount(const BranchList& branches);

}
