#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"
#include "util/Expected.hpp"

namespace gitquery {

/**
 * @brief Flags, valued options and positionals of one command invocation
 *
 * Every command accepts `--file <path>` in addition to its own options.
 * Anything starting with "--" that the command did not declare is an
 * InvalidArgs error, as is a valued option with no value after it.
 */
class CommandArgs {
public:
    static Expected<CommandArgs> parse(const std::vector<std::string>& args,
                                       const std::set<std::string>& flags,
                                       const std::set<std::string>& valued,
                                       size_t maxPositionals = 0);

    bool has(const std::string& flag) const { return present.count(flag) != 0; }
    std::optional<std::string> value(const std::string& option) const;
    const std::vector<std::string>& positionals() const { return positional; }

private:
    std::set<std::string> present;
    std::map<std::string, std::string> values;
    std::vector<std::string> positional;
};

/**
 * @brief Load the captured git output for this invocation
 *
 * Reads the file named by --file, or ctx.input when --file is absent.
 * Fails with IoError when the file cannot be opened or read.
 */
Expected<std::string> readInput(const AppContext& ctx, const CommandArgs& args);

}
