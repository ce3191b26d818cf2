#include "cli/commands/RemoteCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"
#include "decode/RemoteDecoder.hpp"

namespace gitquery {

Expected<void> RemoteCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = CommandArgs::parse(args, {}, {});
    if (!parsed) return parsed.error();

    auto input = readInput(ctx, parsed.value());
    if (!input) return input.error();

    auto remotes = RemoteDecoder::decode(input.value());
    if (!remotes) return remotes.error();

    for (const Remote& remote : remotes.value()) {
        std::cout << remote.name << '\t' << remote.fetchUrl << " (fetch)\n";
        std::cout << remote.name << '\t' << remote.pushUrl() << " (push)\n";
    }
    return {};
}

}
