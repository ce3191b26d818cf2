#pragma once

#include <cstddef>

/**
 * @brief Format constants shared by the decoders and their callers
 *
 * Centralizes field counts, offsets and the exact git format strings the
 * decoders expect, so that whoever runs git requests matching output.
 */
namespace gitquery {

namespace Constants {
    // Identifier display
    constexpr size_t SHORT_HASH_LENGTH = 7;
    constexpr const char* ZERO_HASH = "0000000000000000000000000000000000000000";

    // Status porcelain (v1): "XY <path>"
    constexpr size_t STATUS_MIN_LINE = 3;
    constexpr size_t STATUS_PATH_OFFSET = 3;
    constexpr const char* STATUS_RENAME_ARROW = " -> ";

    // Log records. The delimiter is not escaped by git.
    constexpr char LOG_FIELD_DELIMITER = '|';
    constexpr size_t LOG_MAX_FIELDS = 10;
    constexpr size_t LOG_MIN_FIELDS = 9;
    constexpr const char* LOG_FORMAT = "--pretty=format:%H|%an|%ae|%at|%cn|%ce|%ct|%P|%s|%b";

    // Tag enumeration via for-each-ref
    constexpr char TAG_FIELD_DELIMITER = '|';
    constexpr size_t TAG_FIELDS = 9;
    constexpr const char* TAG_FORMAT =
        "--format=%(refname:short)|%(objecttype)|%(objectname)|%(*objectname)|"
        "%(taggername)|%(taggeremail)|%(taggerdate:unix)|%(subject)|%(body)";

    // Branch enumeration via `branch -vv --all`
    constexpr char CURRENT_BRANCH_MARKER = '*';
    constexpr const char* REMOTE_BRANCH_PREFIX = "remotes/";
    constexpr const char* SYMBOLIC_REF_ARROW = "->";

    // Stash enumeration
    constexpr size_t STASH_FIELDS = 4;
    constexpr const char* STASH_FORMAT = "--format=%gd %H %ct %gs";
    constexpr const char* UNKNOWN_BRANCH = "unknown";
}
}
