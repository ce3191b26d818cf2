#pragma once

#include "cli/ICommand.hpp"

namespace gitquery {

class LogCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "log"; }
    const char* description() const override { return "Decode commit history"; }
    const char* helpNameLine() const override { return "log -  Show commits from a formatted git log"; }
    const char* helpSynopsis() const override {
        return "git log '--pretty=format:%H|%an|%ae|%at|%cn|%ce|%ct|%P|%s|%b' | gitquery log [--file <path>] "
               "[--author <s>] [--grep <s>] [--merges|--no-merges] [--max-count <n>] [--oneline]";
    }
    const char* helpDescription() const override {
        return "Show the decoded commits in input order, newest first as git prints them.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--file <path>", "Read the log from a file instead of standard input."},
            {"--author <s>", "Commits whose author name or email contains <s>."},
            {"--grep <s>", "Commits whose message contains <s>, ignoring case."},
            {"--merges", "Only merge commits."},
            {"--no-merges", "Exclude merge commits."},
            {"--max-count <n>", "Limit the number of commits."},
            {"--oneline", "Condense each commit to a single line."}
        };
    }
};

}
