#include "core/Status.hpp"

namespace gitquery {

IndexStatus indexStatusFromChar(char c) {
    switch (c) {
        case 'M': return IndexStatus::Modified;
        case 'A': return IndexStatus::Added;
        case 'D': return IndexStatus::Deleted;
        case 'R': return IndexStatus::Renamed;
        case 'C': return IndexStatus::Copied;
        default: return IndexStatus::Clean;
    }
}

WorktreeStatus worktreeStatusFromChar(char c) {
    switch (c) {
        case 'M': return WorktreeStatus::Modified;
        case 'D': return WorktreeStatus::Deleted;
        case '?': return WorktreeStatus::Untracked;
        case '!': return WorktreeStatus::Ignored;
        default: return WorktreeStatus::Clean;
    }
}

char toChar(IndexStatus status) {
    switch (status) {
        case IndexStatus::Modified: return 'M';
        case IndexStatus::Added: return 'A';
        case IndexStatus::Deleted: return 'D';
        case IndexStatus::Renamed: return 'R';
        case IndexStatus::Copied: return 'C';
        case IndexStatus::Clean: break;
    }
    return ' ';
}

char toChar(WorktreeStatus status) {
    switch (status) {
        case WorktreeStatus::Modified: return 'M';
        case WorktreeStatus::Deleted: return 'D';
        case WorktreeStatus::Untracked: return '?';
        case WorktreeStatus::Ignored: return '!';
        case WorktreeStatus::Clean: break;
    }
    return ' ';
}

const char* toString(IndexStatus status) {
    switch (status) {
        case IndexStatus::Clean: return "clean";
        case IndexStatus::Modified: return "modified";
        case IndexStatus::Added: return "added";
        case IndexStatus::Deleted: return "deleted";
        case IndexStatus::Renamed: return "renamed";
        case IndexStatus::Copied: return "copied";
    }
    return "unknown";
}

const char* toString(WorktreeStatus status) {
    switch (status) {
        case WorktreeStatus::Clean: return "clean";
        case WorktreeStatus::Modified: return "modified";
        case WorktreeStatus::Deleted: return "deleted";
        case WorktreeStatus::Untracked: return "untracked";
        case WorktreeStatus::Ignored: return "ignored";
    }
    return "unknown";
}

std::string StatusEntry::code() const {
    // Porcelain repeats the marker in both columns for these
    if (isUntracked()) return "??";
    if (isIgnored()) return "!!";
    return std::string{toChar(indexStatus), toChar(worktreeStatus)};
}

bool isClean(const StatusReport& report) {
    return report.empty();
}

bool hasChanges(const StatusReport& report) {
    return !report.empty();
}

FilteredView<StatusEntry> stagedFiles(const StatusReport& report) {
    return report.filter([](const StatusEntry& e) { return e.isStaged(); });
}

FilteredView<StatusEntry> unstagedFiles(const StatusReport& report) {
    return report.filter([](const StatusEntry& e) { return e.isUnstaged(); });
}

FilteredView<StatusEntry> untrackedFiles(const StatusReport& report) {
    return report.filter([](const StatusEntry& e) { return e.isUntracked(); });
}

FilteredView<StatusEntry> ignoredFiles(const StatusReport& report) {
    return report.filter([](const StatusEntry& e) { return e.isIgnored(); });
}

FilteredView<StatusEntry> filesWithIndexStatus(const StatusReport& report, IndexStatus status) {
    return report.filter([status](const StatusEntry& e) { return e.indexStatus == status; });
}

FilteredView<StatusEntry> filesWithWorktreeStatus(const StatusReport& report, WorktreeStatus status) {
    return report.filter([status](const StatusEntry& e) { return e.worktreeStatus == status; });
}

}
