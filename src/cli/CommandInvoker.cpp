#include "cli/CommandInvoker.hpp"

#include "cli/CommandFactory.hpp"
#include "util/Logger.hpp"

namespace gitquery {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name() + " (" +
                             std::to_string(args.size()) + " args)");
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    return {};
}

int CommandInvoker::run(const AppContext& ctx, std::vector<std::string> args) {
    auto& factory = CommandFactory::instance();
    if (args.empty()) {
        auto help = factory.create("help");
        if (!help) return 1;
        return invoke(*help, ctx, {}) ? 0 : 1;
    }

    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = factory.create(cmdName);
    if (!cmd) {
        Logger::instance().error("Unknown command: " + cmdName);
        if (auto help = factory.create("help")) {
            invoke(*help, ctx, {});  // failure already logged; exit code is 1 either way
        }
        return 1;
    }
    return invoke(*cmd, ctx, args) ? 0 : 1;
}

}
