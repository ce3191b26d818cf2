#include "cli/CommandArgs.hpp"

#include <fstream>
#include <sstream>

#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace gitquery {

Expected<CommandArgs> CommandArgs::parse(const std::vector<std::string>& args,
                                         const std::set<std::string>& flags,
                                         const std::set<std::string>& valued,
                                         size_t maxPositionals) {
    CommandArgs out;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (valued.count(arg) || arg == "--file") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "option '" + arg + "' requires a value"};
            }
            out.values[arg] = args[++i];
            out.present.insert(arg);
        } else if (flags.count(arg)) {
            out.present.insert(arg);
        } else if (StringUtils::startsWith(arg, "--")) {
            return Error{ErrorCode::InvalidArgs, "unknown option '" + arg + "'"};
        } else if (out.positional.size() < maxPositionals) {
            out.positional.push_back(arg);
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + arg + "'"};
        }
    }
    return out;
}

std::optional<std::string> CommandArgs::value(const std::string& option) const {
    auto it = values.find(option);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

Expected<std::string> readInput(const AppContext& ctx, const CommandArgs& args) {
    std::ostringstream buffer;
    if (auto path = args.value("--file")) {
        std::ifstream in(*path, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::IoError, "Failed to open " + *path};
        }
        buffer << in.rdbuf();
        if (in.bad()) {
            return Error{ErrorCode::IoError, "Failed to read " + *path};
        }
        Logger::instance().debug("Read " + std::to_string(buffer.str().size()) + " bytes from " + *path);
        return buffer.str();
    }

    if (!ctx.input) {
        return Error{ErrorCode::InvalidArgs, "no input: pass --file <path> or pipe git output"};
    }
    // An empty stream is a valid (empty) report; rdbuf extraction would flag it as failed
    if (ctx.input->peek() != std::char_traits<char>::eof()) {
        buffer << ctx.input->rdbuf();
    }
    if (ctx.input->bad()) {
        return Error{ErrorCode::IoError, "Failed to read standard input"};
    }
    return buffer.str();
}

}
