#pragma once

#include <string>

#include "core/Status.hpp"
#include "decode/DecodeResult.hpp"

namespace gitquery {

/**
 * @brief Decoder for `git status --porcelain` (v1)
 *
 * Line format: "XY <path>" where X is the index code and Y the worktree
 * code. Renames and copies carry "old -> new" in the path field.
 */
class StatusDecoder {
public:
    /// Decode one line; skipped for short lines and clean/clean codes
    static DecodeResult<StatusEntry> decodeLine(const std::string& line);

    /// Decode a whole report. Never fails; malformed lines are skipped.
    static Expected<StatusReport> decode(const std::string& output);
};

}
