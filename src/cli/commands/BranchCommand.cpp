#include "cli/commands/BranchCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"
#include "decode/BranchDecoder.hpp"

namespace gitquery {

Expected<void> BranchCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = CommandArgs::parse(args, {"--local", "--remote"}, {"--contains"});
    if (!parsed) return parsed.error();
    const CommandArgs& opts = parsed.value();

    auto input = readInput(ctx, opts);
    if (!input) return input.error();

    auto branches = BranchDecoder::decode(input.value());
    if (!branches) return branches.error();

    // --local and --remote together select everything, like passing neither
    const bool local = opts.has("--local");
    const bool remote = opts.has("--remote");
    const auto contains = opts.value("--contains");
    auto selected = branches.value().filter([&](const Branch& b) {
        if (local != remote && b.isLocal() != local) return false;
        return !contains || b.name.find(*contains) != std::string::npos;
    });

    for (const Branch& branch : selected) {
        std::cout << (branch.isCurrent ? '*' : ' ') << ' ' << branch.name << ' ' << branch.commitHash.shortHash();
        if (branch.upstream) {
            std::cout << " [" << *branch.upstream << "]";
        }
        std::cout << "\n";
    }
    return {};
}

}
