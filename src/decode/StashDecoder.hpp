#pragma once

#include <string>

#include "core/Stash.hpp"
#include "util/Expected.hpp"

namespace gitquery {

/**
 * @brief Decoder for `git stash list` in Constants::STASH_FORMAT
 *
 * Line: "stash@{0} <hash> <epoch> On <branch>: <message>". Unlike the ref
 * decoders, any malformed line fails the whole list. An unparsable epoch is
 * not an error: the stash gets TimeUtils::epochStart() rather than the
 * current time, so decoding the same text always gives the same result.
 */
class StashDecoder {
public:
    /// Decode one line as the stash at position `index`
    static Expected<Stash> decodeLine(size_t index, const std::string& line);

    static Expected<StashList> decode(const std::string& output);
};

}
