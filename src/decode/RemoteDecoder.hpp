#pragma once

#include <string>

#include "core/Remote.hpp"
#include "util/Expected.hpp"

namespace gitquery {

/**
 * @brief Decoder for `git remote -v`
 *
 * Each remote appears twice, "origin  <url> (fetch)" and
 * "origin  <url> (push)". Remotes keep first-appearance order.
 */
class RemoteDecoder {
public:
    static Expected<RemoteList> decode(const std::string& output);
};

}
