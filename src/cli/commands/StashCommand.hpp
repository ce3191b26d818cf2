#pragma once

#include "cli/ICommand.hpp"

namespace gitquery {

class StashCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "stash"; }
    const char* description() const override { return "Decode `git stash list` output"; }
    const char* helpNameLine() const override { return "stash -  List stash entries"; }
    const char* helpSynopsis() const override {
        return "git stash list '--format=%gd %H %ct %gs' | gitquery stash [--file <path>] [--branch <name>] [--contains <s>]";
    }
    const char* helpDescription() const override {
        return "List stash entries as \"stash@{N}: message\", most recent first. "
               "Any malformed entry fails the whole listing.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--file <path>", "Read the listing from a file instead of standard input."},
            {"--branch <name>", "Entries created on branch <name>."},
            {"--contains <s>", "Entries whose message contains <s>."}
        };
    }
};

}
