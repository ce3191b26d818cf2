// gitquery: typed queries over captured git output, using the command pattern.

#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/BranchCommand.hpp"
#include "cli/commands/DiffCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/RemoteCommand.hpp"
#include "cli/commands/StashCommand.hpp"
#include "cli/commands/StatusCommand.hpp"
#include "cli/commands/TagCommand.hpp"
#include "util/Logger.hpp"

using namespace gitquery;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("status", [] { return std::make_unique<StatusCommand>(); });
    f.registerCreator("log", [] { return std::make_unique<LogCommand>(); });
    f.registerCreator("branches", [] { return std::make_unique<BranchCommand>(); });
    f.registerCreator("tags", [] { return std::make_unique<TagCommand>(); });
    f.registerCreator("stash", [] { return std::make_unique<StashCommand>(); });
    f.registerCreator("diff", [] { return std::make_unique<DiffCommand>(); });
    f.registerCreator("remotes", [] { return std::make_unique<RemoteCommand>(); });
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    // Global option, accepted before the command name only
    if (args.size() >= 2 && args[0] == "--log-level") {
        LogLevel level = LogLevel::Info;
        if (!Logger::parseLevel(args[1], level)) {
            Logger::instance().error("invalid --log-level: " + args[1]);
            return 1;
        }
        Logger::instance().setLevel(level);
        args.erase(args.begin(), args.begin() + 2);
    }

    AppContext ctx{};
    CommandInvoker invoker;
    return invoker.run(ctx, args);
}
