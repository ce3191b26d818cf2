#include "core/Branch.hpp"

namespace gitquery {

const char* toString(BranchType type) {
    switch (type) {
        case BranchType::Local: return "local";
        case BranchType::RemoteTracking: return "remote-tracking";
    }
    return "unknown";
}

std::string Branch::shortName() const {
    if (!isRemote()) return name;
    size_t slash = name.find('/');
    if (slash == std::string::npos) return name;
    return name.substr(slash + 1);
}

std::string Branch::toString() const {
    return std::string(isCurrent ? "* " : "  ") + name;
}

FilteredView<Branch> localBranches(const BranchList& branches) {
    return branches.filter([](const Branch& b) { return b.isLocal(); });
}

FilteredView<Branch> remoteBranches(const BranchList& branches) {
    return branches.filter([](const Branch& b) { return b.isRemote(); });
}

const Branch* currentBranch(const BranchList& branches) {
    for (const Branch& b : branches) {
        if (b.isCurrent) return &b;
    }
    return nullptr;
}

const Branch* findByShortName(const BranchList& branches, const std::string& shortName) {
    for (const Branch& b : branches) {
        if (b.shortName() == shortName) return &b;
    }
    return nullptr;
}

size_t localCount(const BranchList& branches) {
    return branches.count([](const Branch& b) { return b.isLocal(); });
}

size_t remoteCount(const BranchList& branches) {
    return branches.count([](const Branch& b) { return b.isRemote(); });
}

}
