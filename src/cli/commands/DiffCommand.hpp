#pragma once

#include "cli/ICommand.hpp"

namespace gitquery {

class DiffCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "diff"; }
    const char* description() const override { return "Decode `git diff` output"; }
    const char* helpNameLine() const override { return "diff -  Summarize changed files from a diff"; }
    const char* helpSynopsis() const override {
        return "git diff [--name-only|--numstat|--stat] | gitquery diff [--file <path>] "
               "[--name-only|--numstat|--stat] [--status <kind>]";
    }
    const char* helpDescription() const override {
        return "Print one line per changed file followed by the totals line. The mode flag must "
               "match the git invocation; without one the input is a full patch.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--file <path>", "Read the diff from a file instead of standard input."},
            {"--name-only", "Input is `git diff --name-only`."},
            {"--numstat", "Input is `git diff --numstat`."},
            {"--stat", "Input is `git diff --stat`."},
            {"--status <kind>", "Only files with status added, modified, deleted, renamed or copied."}
        };
    }
};

}
