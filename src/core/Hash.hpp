#pragma once

#include <ostream>
#include <string>

namespace gitquery {

/**
 * @brief Opaque content identifier (commit, tree, blob or tag object id)
 *
 * The raw string is kept exactly as git reported it: no normalization and
 * no case folding, so equality and ordering are plain string comparisons.
 */
class Hash {
public:
    Hash() = default;
    explicit Hash(std::string value);

    /// Full identifier as reported
    const std::string& str() const { return value; }

    /// First 7 characters, or the whole string if shorter
    std::string shortHash() const;

    bool empty() const { return value.empty(); }

    /// All-zero 40-character identifier
    static Hash zero();

    bool operator==(const Hash& other) const { return value == other.value; }
    bool operator!=(const Hash& other) const { return value != other.value; }
    bool operator<(const Hash& other) const { return value < other.value; }

private:
    std::string value;
};

std::ostream& operator<<(std::ostream& os, const Hash& hash);

}
