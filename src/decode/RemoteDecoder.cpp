#include "decode/RemoteDecoder.hpp"

#include <vector>

#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace gitquery {

Expected<RemoteList> RemoteDecoder::decode(const std::string& output) {
    std::vector<Remote> remotes;
    std::vector<std::string> pushUrls;  // parallel to remotes; empty = not reported

    for (const std::string& line : StringUtils::splitLines(output)) {
        std::vector<std::string> tokens = StringUtils::splitWhitespace(line);
        if (tokens.empty()) continue;
        if (tokens.size() < 3 || (tokens[2] != "(fetch)" && tokens[2] != "(push)")) {
            Logger::instance().debug("remote: skipping line '" + line + "'");
            continue;
        }

        size_t i = 0;
        while (i < remotes.size() && remotes[i].name != tokens[0]) ++i;
        if (i == remotes.size()) {
            remotes.push_back(Remote{tokens[0], "", std::nullopt});
            pushUrls.emplace_back();
        }

        if (tokens[2] == "(fetch)") {
            remotes[i].fetchUrl = tokens[1];
        } else {
            pushUrls[i] = tokens[1];
        }
    }

    for (size_t i = 0; i < remotes.size(); ++i) {
        if (remotes[i].fetchUrl.empty()) {
            remotes[i].fetchUrl = pushUrls[i];
        } else if (!pushUrls[i].empty() && pushUrls[i] != remotes[i].fetchUrl) {
            remotes[i].pushUrlOverride = pushUrls[i];
        }
    }
    return RemoteList(std::move(remotes));
}

}
