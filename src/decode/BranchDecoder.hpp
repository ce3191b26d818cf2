#pragma once

#include <string>

#include "core/Branch.hpp"
#include "decode/DecodeResult.hpp"

namespace gitquery {

/**
 * @brief Decoder for `git branch -vv --all`
 *
 * Example lines:
 *   * main                  1a2b3c4 [origin/main: ahead 1] Subject
 *     remotes/origin/main   1a2b3c4 Subject
 *     remotes/origin/HEAD -> origin/main      (skipped)
 */
class BranchDecoder {
public:
    static DecodeResult<Branch> decodeLine(const std::string& line);

    /// Never fails; unusable lines are skipped. Result is sorted by name.
    static Expected<BranchList> decode(const std::string& output);
};

}
