#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace gitquery {

/**
 * @brief Registry of command creators keyed by command name
 *
 * Commands are registered once at start-up (see main.cpp) and created on
 * demand, so each invocation gets a fresh instance.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);
    bool has(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// One instance of every registered command, ordered by name
    std::vector<std::unique_ptr<ICommand>> listCommands() const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
};

}
