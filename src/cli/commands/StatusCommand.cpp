#include "cli/commands/StatusCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"
#include "decode/StatusDecoder.hpp"

namespace gitquery {

/**
 * @brief Execute 'gitquery status'
 *
 * Output mirrors porcelain: "XY path", with "XY old -> new" for renames.
 * Multiple filters combine with OR.
 */
Expected<void> StatusCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = CommandArgs::parse(args, {"--staged", "--unstaged", "--untracked", "--ignored"}, {});
    if (!parsed) return parsed.error();
    const CommandArgs& opts = parsed.value();

    auto input = readInput(ctx, opts);
    if (!input) return input.error();

    auto report = StatusDecoder::decode(input.value());
    if (!report) return report.error();

    if (isClean(report.value())) {
        std::cout << "nothing to commit, working tree clean\n";
        return {};
    }

    const bool staged = opts.has("--staged");
    const bool unstaged = opts.has("--unstaged");
    const bool untracked = opts.has("--untracked");
    const bool ignored = opts.has("--ignored");
    const bool anyFilter = staged || unstaged || untracked || ignored;

    auto selected = report.value().filter([&](const StatusEntry& e) {
        if (!anyFilter) return true;
        return (staged && e.isStaged()) || (unstaged && e.isUnstaged()) ||
            (untracked && e.isUntracked()) || (ignored && e.isIgnored());
    });

    for (const StatusEntry& entry : selected) {
        std::cout << entry.code() << ' ';
        if (entry.originalPath) {
            std::cout << *entry.originalPath << " -> ";
        }
        std::cout << entry.path << "\n";
    }
    return {};
}

}
