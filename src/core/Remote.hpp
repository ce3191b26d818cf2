#pragma once

#include <optional>
#include <string>

#include "core/RecordCollection.hpp"

namespace gitquery {

/**
 * @brief Named remote with its fetch URL and, if different, its push URL
 */
struct Remote {
    std::string name;
    std::string fetchUrl;
    std::optional<std::string> pushUrlOverride;

    /// Effective push URL (falls back to the fetch URL)
    const std::string& pushUrl() const { return pushUrlOverride ? *pushUrlOverride : fetchUrl; }
};

template <>
struct RecordTraits<Remote> {
    static constexpr bool kSortedByKey = false;
    static const std::string& key(const Remote& remote) { return remote.name; }
};

using RemoteList = RecordCollection<Remote>;

}
