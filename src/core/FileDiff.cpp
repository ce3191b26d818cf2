#include "core/FileDiff.hpp"

#include "util/StringUtils.hpp"

namespace gitquery {

std::optional<DiffStatus> diffStatusFromChar(char c) {
    switch (c) {
        case 'A': return DiffStatus::Added;
        case 'M': return DiffStatus::Modified;
        case 'D': return DiffStatus::Deleted;
        case 'R': return DiffStatus::Renamed;
        case 'C': return DiffStatus::Copied;
        default: return std::nullopt;
    }
}

char toChar(DiffStatus status) {
    switch (status) {
        case DiffStatus::Added: return 'A';
        case DiffStatus::Modified: return 'M';
        case DiffStatus::Deleted: return 'D';
        case DiffStatus::Renamed: return 'R';
        case DiffStatus::Copied: return 'C';
    }
    return '?';
}

const char* toString(DiffStatus status) {
    switch (status) {
        case DiffStatus::Added: return "added";
        case DiffStatus::Modified: return "modified";
        case DiffStatus::Deleted: return "deleted";
        case DiffStatus::Renamed: return "renamed";
        case DiffStatus::Copied: return "copied";
    }
    return "unknown";
}

std::optional<DiffStatus> diffStatusFromName(const std::string& name) {
    if (name.size() == 1) return diffStatusFromChar(name[0]);
    const std::string lower = StringUtils::toLower(name);
    for (DiffStatus s : {DiffStatus::Added, DiffStatus::Modified, DiffStatus::Deleted,
                         DiffStatus::Renamed, DiffStatus::Copied}) {
        if (lower == toString(s)) return s;
    }
    return std::nullopt;
}

std::optional<DiffLineType> diffLineTypeFromChar(char c) {
    switch (c) {
        case ' ': return DiffLineType::Context;
        case '+': return DiffLineType::Added;
        case '-': return DiffLineType::Removed;
        default: return std::nullopt;
    }
}

char toChar(DiffLineType type) {
    switch (type) {
        case DiffLineType::Context: return ' ';
        case DiffLineType::Added: return '+';
        case DiffLineType::Removed: return '-';
    }
    return ' ';
}

std::string FileDiff::toString() const {
    std::string out = gitquery::toString(status);
    out += ' ';
    if (oldPath) {
        out += *oldPath + " -> ";
    }
    return out + path;
}

void DiffStats::addFile(size_t fileAdditions, size_t fileDeletions) {
    ++filesChanged;
    insertions += fileAdditions;
    deletions += fileDeletions;
}

std::string DiffStats::toString() const {
    return std::to_string(filesChanged) + " files changed, " + std::to_string(insertions) +
        " insertions(+), " + std::to_string(deletions) + " deletions(-)";
}

FilteredView<FileDiff> filesWithStatus(const DiffReport& report, DiffStatus status) {
    return report.filter([status](const FileDiff& f) { return f.status == status; });
}

DiffStats summarize(const DiffReport& report) {
    DiffStats stats;
    for (const FileDiff& f : report) {
        stats.addFile(f.additions, f.deletions);
    }
    return stats;
}

}
