#include "cli/commands/StashCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"
#include "decode/StashDecoder.hpp"

namespace gitquery {

Expected<void> StashCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = CommandArgs::parse(args, {}, {"--branch", "--contains"});
    if (!parsed) return parsed.error();
    const CommandArgs& opts = parsed.value();

    auto input = readInput(ctx, opts);
    if (!input) return input.error();

    auto stashes = StashDecoder::decode(input.value());
    if (!stashes) return stashes.error();

    const auto branch = opts.value("--branch");
    const auto contains = opts.value("--contains");
    auto selected = stashes.value().filter([&](const Stash& s) {
        if (branch && s.branch != *branch) return false;
        return !contains || s.message.find(*contains) != std::string::npos;
    });

    for (const Stash& stash : selected) {
        std::cout << stash.toString() << "\n";
    }
    return {};
}

}
