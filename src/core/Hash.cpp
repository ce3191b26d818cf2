#include "core/Hash.hpp"

#include <utility>

#include "core/Constants.hpp"

namespace gitquery {

Hash::Hash(std::string value) : value(std::move(value)) {}

std::string Hash::shortHash() const {
    return value.length() >= Constants::SHORT_HASH_LENGTH
        ? value.substr(0, Constants::SHORT_HASH_LENGTH)
        : value;
}

Hash Hash::zero() {
    return Hash(Constants::ZERO_HASH);
}

std::ostream& operator<<(std::ostream& os, const Hash& hash) {
    return os << hash.str();
}

}
