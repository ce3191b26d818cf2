#pragma once

#include "cli/ICommand.hpp"

namespace gitquery {

class RemoteCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "remotes"; }
    const char* description() const override { return "Decode `git remote -v` output"; }
    const char* helpNameLine() const override { return "remotes -  List remotes with their fetch and push URLs"; }
    const char* helpSynopsis() const override { return "git remote -v | gitquery remotes [--file <path>]"; }
    const char* helpDescription() const override {
        return "Print each remote twice, once with its fetch URL and once with its effective push URL.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--file <path>", "Read the listing from a file instead of standard input."} };
    }
};

}
