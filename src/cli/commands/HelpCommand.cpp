#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "util/Logger.hpp"

namespace gitquery {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "NAME:\n" << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << "  " << opt << " :  " << desc << "\n";
        }
        std::cout << "\n";
    }
}

}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        const std::string& topic = args.front();
        if (auto cmd = CommandFactory::instance().create(topic)) {
            printCommandDetail(*cmd);
            return {};
        }
        Logger::instance().warn("Unknown help topic: " + topic);
    }

    std::cout << "usage: gitquery <command> [--file <path>] [options]\n\n";
    std::cout << "Decode captured git output read from --file or standard input.\n\n";
    for (const auto& c : CommandFactory::instance().listCommands()) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }
    std::cout << "\nSee 'gitquery help <command>' for the git invocation each command expects.\n";
    return {};
}

}
