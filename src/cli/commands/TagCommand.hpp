#pragma once

#include "cli/ICommand.hpp"

namespace gitquery {

class TagCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "tags"; }
    const char* description() const override { return "Decode tag listings"; }
    const char* helpNameLine() const override { return "tags -  List lightweight and annotated tags"; }
    const char* helpSynopsis() const override {
        return "git for-each-ref '<TAG_FORMAT>' refs/tags/ | gitquery tags [--file <path>] "
               "[--annotated|--lightweight] [--contains <s>]\n"
               "git show --format=fuller <name> | gitquery tags --show <name> [--file <path>]";
    }
    const char* helpDescription() const override {
        return "List tags sorted by name as \"<name> (<type>) -> <short-hash>\". With --show, "
               "decode a single tag from `git show --format=fuller` output instead.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--file <path>", "Read the listing from a file instead of standard input."},
            {"--annotated", "Only annotated tags."},
            {"--lightweight", "Only lightweight tags."},
            {"--contains <s>", "Tags whose name contains <s>."},
            {"--show <name>", "Input is `git show --format=fuller <name>` for one tag."}
        };
    }
};

}
