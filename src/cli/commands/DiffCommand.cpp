#include "cli/commands/DiffCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"
#include "decode/DiffDecoder.hpp"

namespace gitquery {

Expected<void> DiffCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = CommandArgs::parse(args, {"--name-only", "--numstat", "--stat"}, {"--status"});
    if (!parsed) return parsed.error();
    const CommandArgs& opts = parsed.value();

    DiffMode mode = DiffMode::Patch;
    int modeFlags = 0;
    if (opts.has("--name-only")) { mode = DiffMode::NameOnly; ++modeFlags; }
    if (opts.has("--numstat")) { mode = DiffMode::NumStat; ++modeFlags; }
    if (opts.has("--stat")) { mode = DiffMode::Stat; ++modeFlags; }
    if (modeFlags > 1) {
        return Error{ErrorCode::InvalidArgs, "--name-only, --numstat and --stat are mutually exclusive"};
    }

    std::optional<DiffStatus> status;
    if (auto kind = opts.value("--status")) {
        status = diffStatusFromName(*kind);
        if (!status) {
            return Error{ErrorCode::InvalidArgs, "unknown diff status: " + *kind};
        }
    }

    auto input = readInput(ctx, opts);
    if (!input) return input.error();

    auto diff = DiffDecoder::decode(input.value(), mode);
    if (!diff) return diff.error();
    const DiffOutput& out = diff.value();

    if (out.files.empty()) {
        std::cout << "No differences found\n";
        return {};
    }

    // Exact counts exist only for numstat and patch input
    const bool withCounts = mode == DiffMode::NumStat || mode == DiffMode::Patch;
    DiffStats shownStats;
    for (const FileDiff& file : out.files) {
        if (status && file.status != *status) continue;
        std::cout << file.toString();
        if (file.isBinary()) {
            std::cout << " (binary)";
        } else if (withCounts) {
            std::cout << " +" << file.additions << " -" << file.deletions;
        }
        std::cout << "\n";
        shownStats.addFile(file.additions, file.deletions);
    }
    std::cout << (status ? shownStats : out.stats).toString() << "\n";
    return {};
}

}
