#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace gitquery {

class CommandInvoker {
public:
    /// Run one command; failures are logged as "<cmd>: <message>"
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /**
     * @brief Dispatch a full argument vector (without the program name)
     *
     * No arguments prints help. An unknown command prints help and fails.
     * Returns the process exit code: 0 on success, 1 on any error.
     */
    int run(const AppContext& ctx, std::vector<std::string> args);
};

}
