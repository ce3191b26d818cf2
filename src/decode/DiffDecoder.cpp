#include "decode/DiffDecoder.hpp"

#include <cctype>
#include <vector>

#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace gitquery {

const char* toString(DiffMode mode) {
    switch (mode) {
        case DiffMode::NameOnly: return "name-only";
        case DiffMode::NumStat: return "numstat";
        case DiffMode::Stat: return "stat";
        case DiffMode::Patch: return "patch";
    }
    return "unknown";
}

namespace {

DiffOutput withSummedStats(std::vector<FileDiff> files) {
    DiffOutput out;
    out.files = DiffReport(std::move(files));
    out.stats = summarize(out.files);
    return out;
}

// Integer written immediately before `marker` ("18 insertions(+)" -> 18)
size_t numberBefore(const std::string& line, const std::string& marker) {
    size_t pos = line.find(marker);
    if (pos == std::string::npos) return 0;
    size_t start = pos;
    while (start > 0 && std::isdigit(static_cast<unsigned char>(line[start - 1]))) {
        --start;
    }
    size_t value = 0;
    if (start == pos || !StringUtils::parseSize(line.substr(start, pos - start), value)) {
        return 0;
    }
    return value;
}

// "-12,3" / "+7" -> start and count (count defaults to 1)
bool parseRange(const std::string& token, size_t& start, size_t& count) {
    if (token.size() < 2) return false;
    std::vector<std::string> parts = StringUtils::splitN(token.substr(1), ',', 2);
    if (!StringUtils::parseSize(parts[0], start)) return false;
    count = 1;
    if (parts.size() == 2 && !StringUtils::parseSize(parts[1], count)) return false;
    return true;
}

// Mutable cursor over a patch while records are being assembled
class PatchBuilder {
public:
    void startFile(const std::string& header) {
        finishFile();
        current = FileDiff{};
        // "diff --git a/<old> b/<new>"
        std::string rest = header.substr(std::string("diff --git ").size());
        size_t split = rest.rfind(" b/");
        current->path = split != std::string::npos ? rest.substr(split + 3) : rest;
    }

    void handleLine(const std::string& line) {
        if (!current) return;

        if (chunk && (remainingOld > 0 || remainingNew > 0) && !line.empty()) {
            if (auto type = diffLineTypeFromChar(line[0])) {
                addChunkLine(*type, line.substr(1));
                return;
            }
        }

        if (StringUtils::startsWith(line, "@@ ")) {
            startChunk(line);
        } else if (StringUtils::startsWith(line, "new file mode")) {
            current->status = DiffStatus::Added;
        } else if (StringUtils::startsWith(line, "deleted file mode")) {
            current->status = DiffStatus::Deleted;
        } else if (StringUtils::startsWith(line, "rename from ")) {
            current->status = DiffStatus::Renamed;
            current->oldPath = line.substr(std::string("rename from ").size());
        } else if (StringUtils::startsWith(line, "rename to ")) {
            current->path = line.substr(std::string("rename to ").size());
        } else if (StringUtils::startsWith(line, "copy from ")) {
            current->status = DiffStatus::Copied;
            current->oldPath = line.substr(std::string("copy from ").size());
        } else if (StringUtils::startsWith(line, "copy to ")) {
            current->path = line.substr(std::string("copy to ").size());
        } else if (StringUtils::startsWith(line, "Binary files ") || line == "GIT binary patch") {
            current->binary = true;
        }
        // index, mode, similarity, ---/+++ headers and "\ No newline" carry nothing we keep
    }

    std::vector<FileDiff> finish() {
        finishFile();
        return std::move(files);
    }

private:
    void startChunk(const std::string& line) {
        finishChunk();
        std::vector<std::string> tokens = StringUtils::splitWhitespace(line);
        DiffChunk next;
        if (tokens.size() < 3 ||
            !parseRange(tokens[1], next.oldStart, next.oldCount) ||
            !parseRange(tokens[2], next.newStart, next.newCount)) {
            Logger::instance().debug("diff: ignoring malformed hunk header '" + line + "'");
            return;
        }
        remainingOld = next.oldCount;
        remainingNew = next.newCount;
        chunk = std::move(next);
    }

    void addChunkLine(DiffLineType type, std::string content) {
        switch (type) {
            case DiffLineType::Context:
                if (remainingOld > 0) --remainingOld;
                if (remainingNew > 0) --remainingNew;
                break;
            case DiffLineType::Added:
                ++current->additions;
                if (remainingNew > 0) --remainingNew;
                break;
            case DiffLineType::Removed:
                ++current->deletions;
                if (remainingOld > 0) --remainingOld;
                break;
        }
        chunk->lines.push_back(DiffLine{type, std::move(content)});
    }

    void finishChunk() {
        if (chunk && current) current->chunks.push_back(std::move(*chunk));
        chunk.reset();
        remainingOld = remainingNew = 0;
    }

    void finishFile() {
        finishChunk();
        if (!current) return;
        files.push_back(std::move(*current));
        current.reset();
    }

    std::vector<FileDiff> files;
    std::optional<FileDiff> current;
    std::optional<DiffChunk> chunk;
    size_t remainingOld{0};
    size_t remainingNew{0};
};

}  // namespace

Expected<DiffOutput> DiffDecoder::decode(const std::string& output, DiffMode mode) {
    switch (mode) {
        case DiffMode::NameOnly: return decodeNameOnly(output);
        case DiffMode::NumStat: return decodeNumstat(output);
        case DiffMode::Stat: return decodeStat(output);
        case DiffMode::Patch: return decodePatch(output);
    }
    return Error{ErrorCode::InvalidArgs, "Unknown diff mode"};
}

Expected<DiffOutput> DiffDecoder::decodeNameOnly(const std::string& output) {
    std::vector<FileDiff> files;
    for (const std::string& line : StringUtils::splitLines(output)) {
        if (line.empty()) continue;
        FileDiff diff;
        diff.path = line;
        diff.status = DiffStatus::Modified;
        files.push_back(std::move(diff));
    }
    return withSummedStats(std::move(files));
}

Expected<DiffOutput> DiffDecoder::decodeNumstat(const std::string& output) {
    std::vector<FileDiff> files;
    for (const std::string& line : StringUtils::splitLines(output)) {
        if (line.empty()) continue;
        std::vector<std::string> parts = StringUtils::splitN(line, '\t', 3);
        if (parts.size() < 3) {
            Logger::instance().debug("diff: skipping numstat line '" + line + "'");
            continue;
        }

        FileDiff diff;
        diff.path = parts[2];
        diff.binary = parts[0] == "-" && parts[1] == "-";
        if (!StringUtils::parseSize(parts[0], diff.additions)) diff.additions = 0;
        if (!StringUtils::parseSize(parts[1], diff.deletions)) diff.deletions = 0;

        if (diff.additions > 0 && diff.deletions == 0) {
            diff.status = DiffStatus::Added;
        } else if (diff.additions == 0 && diff.deletions > 0) {
            diff.status = DiffStatus::Deleted;
        } else {
            diff.status = DiffStatus::Modified;
        }
        files.push_back(std::move(diff));
    }
    return withSummedStats(std::move(files));
}

Expected<DiffOutput> DiffDecoder::decodeStat(const std::string& output) {
    std::vector<FileDiff> files;
    std::optional<DiffStats> summary;
    const std::string separator = " | ";

    for (const std::string& line : StringUtils::splitLines(output)) {
        size_t pipe = line.find(separator);
        if (pipe != std::string::npos) {
            if (line.find(separator, pipe + separator.size()) != std::string::npos) {
                Logger::instance().debug("diff: ambiguous stat line '" + line + "'");
                continue;
            }
            FileDiff diff;
            diff.path = StringUtils::trim(line.substr(0, pipe));
            diff.status = DiffStatus::Modified;
            files.push_back(std::move(diff));
        } else if (auto parsed = parseStatSummary(line)) {
            summary = parsed;
        }
    }

    DiffOutput out;
    out.stats = summary ? *summary : DiffStats{};
    if (!summary) {
        out.stats.filesChanged = files.size();
    }
    out.files = DiffReport(std::move(files));
    return out;
}

Expected<DiffOutput> DiffDecoder::decodePatch(const std::string& output) {
    PatchBuilder builder;
    for (const std::string& line : StringUtils::splitLines(output)) {
        if (StringUtils::startsWith(line, "diff --git ")) {
            builder.startFile(line);
        } else {
            builder.handleLine(line);
        }
    }
    return withSummedStats(builder.finish());
}

std::optional<DiffStats> DiffDecoder::parseStatSummary(const std::string& line) {
    const bool plural = StringUtils::contains(line, " files changed");
    if (!plural && !StringUtils::contains(line, " file changed")) {
        return std::nullopt;
    }
    DiffStats stats;
    stats.filesChanged = numberBefore(line, plural ? " files changed" : " file changed");
    stats.insertions = numberBefore(line, " insertion");
    stats.deletions = numberBefore(line, " deletion");
    return stats;
}

}
