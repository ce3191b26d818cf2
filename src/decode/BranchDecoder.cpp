#include "decode/BranchDecoder.hpp"

#include <vector>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace gitquery {

DecodeResult<Branch> BranchDecoder::decodeLine(const std::string& rawLine) {
    std::string line = StringUtils::trim(rawLine);
    if (line.empty() || StringUtils::contains(line, Constants::SYMBOLIC_REF_ARROW)) {
        return skipped<Branch>();
    }

    Branch branch;
    if (line[0] == Constants::CURRENT_BRANCH_MARKER) {
        branch.isCurrent = true;
        line = StringUtils::trim(line.substr(1));
    }

    std::vector<std::string> tokens = StringUtils::splitWhitespace(line);
    if (tokens.empty()) {
        return skipped<Branch>();
    }

    branch.name = tokens[0];
    if (StringUtils::startsWith(branch.name, Constants::REMOTE_BRANCH_PREFIX)) {
        branch.type = BranchType::RemoteTracking;
        branch.name = branch.name.substr(std::string(Constants::REMOTE_BRANCH_PREFIX).size());
    }
    branch.commitHash = tokens.size() > 1 ? Hash(tokens[1]) : Hash::zero();

    // "[origin/main: ahead 1, behind 2]" -> "origin/main"
    size_t open = line.find('[');
    size_t close = open == std::string::npos ? std::string::npos : line.find(']', open);
    if (close != std::string::npos) {
        std::string info = line.substr(open + 1, close - open - 1);
        std::string upstream = StringUtils::trim(info.substr(0, info.find(':')));
        if (!upstream.empty()) {
            branch.upstream = upstream;
        }
    }
    return decoded(std::move(branch));
}

Expected<BranchList> BranchDecoder::decode(const std::string& output) {
    std::vector<Branch> branches;
    for (const std::string& line : StringUtils::splitLines(output)) {
        auto result = decodeLine(line);
        if (result.value()) {
            branches.push_back(std::move(*result.value()));
        } else if (!StringUtils::trim(line).empty()) {
            Logger::instance().debug("branch: skipping line '" + line + "'");
        }
    }
    return BranchList(std::move(branches));
}

}
