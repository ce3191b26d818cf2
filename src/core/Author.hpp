#pragma once

#include <string>

#include "util/TimeUtils.hpp"

namespace gitquery {

/**
 * @brief Person plus the moment they acted (author, committer or tagger)
 */
struct Author {
    std::string name;
    std::string email;
    Timestamp timestamp{};

    /// "Name <email>"
    std::string toString() const { return name + " <" + email + ">"; }
};

}
