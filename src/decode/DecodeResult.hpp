#pragma once

#include <optional>
#include <utility>

#include "util/Expected.hpp"

namespace gitquery {

/**
 * @brief Outcome of decoding one line: a record, nothing (skip) or an error
 *
 * Skip and error are distinct on purpose: skip-on-malformed decoders
 * return skipped(), fail-on-malformed decoders return an Error.
 */
template <typename T>
using DecodeResult = Expected<std::optional<T>>;

template <typename T>
DecodeResult<T> decoded(T record) {
    return DecodeResult<T>(std::optional<T>(std::move(record)));
}

template <typename T>
DecodeResult<T> skipped() {
    return DecodeResult<T>(std::optional<T>());
}

}
