#pragma once

#include "cli/ICommand.hpp"

namespace gitquery {

class StatusCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "status"; }
    const char* description() const override { return "Decode `git status --porcelain` output"; }
    const char* helpNameLine() const override { return "status -  Show changed paths from a porcelain status report"; }
    const char* helpSynopsis() const override {
        return "git status --porcelain | gitquery status [--file <path>] [--staged] [--unstaged] [--untracked] [--ignored]";
    }
    const char* helpDescription() const override {
        return "Print one \"XY path\" line per changed path. With filters, only paths matching any of them are shown.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--file <path>", "Read the report from a file instead of standard input."},
            {"--staged", "Paths with a change in the index."},
            {"--unstaged", "Paths with a change in the working tree."},
            {"--untracked", "Untracked paths."},
            {"--ignored", "Ignored paths (requires --ignored when running git)."}
        };
    }
};

}
