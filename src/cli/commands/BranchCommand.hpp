#pragma once

#include "cli/ICommand.hpp"

namespace gitquery {

class BranchCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "branches"; }
    const char* description() const override { return "Decode `git branch -vv --all` output"; }
    const char* helpNameLine() const override { return "branches -  List local and remote-tracking branches"; }
    const char* helpSynopsis() const override {
        return "git branch -vv --all | gitquery branches [--file <path>] [--local|--remote] [--contains <s>]";
    }
    const char* helpDescription() const override {
        return "List branches sorted by name as \"<marker> <name> <short-hash> [upstream]\", "
               "where the marker is '*' for the checked-out branch.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--file <path>", "Read the listing from a file instead of standard input."},
            {"--local", "Only local branches."},
            {"--remote", "Only remote-tracking branches."},
            {"--contains <s>", "Branches whose name contains <s>."}
        };
    }
};

}
