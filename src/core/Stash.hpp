#pragma once

#include <string>

#include "core/Hash.hpp"
#include "core/RecordCollection.hpp"
#include "util/TimeUtils.hpp"

namespace gitquery {

/**
 * @brief One entry of `git stash list`
 *
 * index is positional (0 = most recent) and shifts whenever the stash
 * stack changes; it is not a stable identity.
 */
struct Stash {
    size_t index{0};
    std::string message;
    Hash hash;
    std::string branch;
    Timestamp timestamp{};

    /// "stash@{N}"
    std::string refName() const;

    /// "stash@{N}: message"
    std::string toString() const;
};

template <>
struct RecordTraits<Stash> {
    static constexpr bool kSortedByKey = false;
    static const std::string& key(const Stash& stash) { return stash.message; }
};

using StashList = RecordCollection<Stash>;

const Stash* latestStash(const StashList& stashes);

/// Stash with the given index, or nullptr
const Stash* stashAt(const StashList& stashes, size_t index);

FilteredView<Stash> stashesForBranch(const StashList& stashes, const std::string& branch);

}
