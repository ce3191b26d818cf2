#include "core/Stash.hpp"

namespace gitquery {

std::string Stash::refName() const {
    return "stash@{" + std::to_string(index) + "}";
}

std::string Stash::toString() const {
    return refName() + ": " + message;
}

const Stash* latestStash(const StashList& stashes) {
    return stashes.first();
}

const Stash* stashAt(const StashList& stashes, size_t index) {
    for (const Stash& s : stashes) {
        if (s.index == index) return &s;
    }
    return nullptr;
}

FilteredView<Stash> stashesForBranch(const StashList& stashes, const std::string& branch) {
    return stashes.filter([branch](const Stash& s) { return s.branch == branch; });
}

}
