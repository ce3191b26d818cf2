#include "cli/commands/LogCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"
#include "decode/LogDecoder.hpp"
#include "util/StringUtils.hpp"

namespace gitquery {

namespace {

void printCommit(const Commit& commit) {
    std::cout << "commit " << commit.hash << "\n";
    if (commit.isMerge()) {
        std::cout << "Merge:";
        for (const Hash& parent : commit.parents) {
            std::cout << ' ' << parent.shortHash();
        }
        std::cout << "\n";
    }
    std::cout << "Author: " << commit.author.toString() << "\n";
    std::cout << "Date:   " << TimeUtils::formatUtc(commit.timestamp, "%a %b %d %H:%M:%S %Y +0000") << "\n";
    std::cout << "\n";

    // Message (indented)
    for (const std::string& line : StringUtils::splitLines(commit.message.full())) {
        std::cout << "    " << line << "\n";
    }
}

}

/**
 * @brief Execute 'gitquery log'
 *
 * Filters combine with AND. The input order is kept; --max-count applies
 * after filtering.
 */
Expected<void> LogCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = CommandArgs::parse(args, {"--merges", "--no-merges", "--oneline"},
                                     {"--author", "--grep", "--max-count"});
    if (!parsed) return parsed.error();
    const CommandArgs& opts = parsed.value();

    if (opts.has("--merges") && opts.has("--no-merges")) {
        return Error{ErrorCode::InvalidArgs, "--merges and --no-merges are mutually exclusive"};
    }
    size_t maxCount = 0;
    auto maxCountText = opts.value("--max-count");
    if (maxCountText && !StringUtils::parseSize(*maxCountText, maxCount)) {
        return Error{ErrorCode::InvalidArgs, "invalid --max-count: " + *maxCountText};
    }

    auto input = readInput(ctx, opts);
    if (!input) return input.error();

    auto log = LogDecoder::decode(input.value());
    if (!log) return log.error();

    if (log.value().empty()) {
        std::cout << "your current branch does not have any commits yet\n";
        return {};
    }

    const auto author = opts.value("--author");
    const auto grep = opts.value("--grep");
    const bool merges = opts.has("--merges");
    const bool noMerges = opts.has("--no-merges");
    auto selected = log.value().filter([&](const Commit& c) {
        if (author && !c.isAuthoredBy(*author)) return false;
        if (grep && !c.messageContains(*grep)) return false;
        if (merges && !c.isMerge()) return false;
        if (noMerges && c.isMerge()) return false;
        return true;
    });

    const bool oneline = opts.has("--oneline");
    size_t shown = 0;
    for (const Commit& commit : selected) {
        if (maxCountText && shown == maxCount) break;
        if (oneline) {
            std::cout << commit.hash.shortHash() << ' ' << commit.message.subject << "\n";
        } else {
            if (shown > 0) std::cout << "\n";
            printCommit(commit);
        }
        ++shown;
    }
    return {};
}

}
