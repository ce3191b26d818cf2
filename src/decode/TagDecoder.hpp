#pragma once

#include <string>

#include "core/Tag.hpp"
#include "util/Expected.hpp"

namespace gitquery {

/**
 * @brief Decoder for tag enumerations
 *
 * Primary input is `git for-each-ref refs/tags/` in Constants::TAG_FORMAT.
 * For a single tag, `git show --format=fuller <tag>` can be decoded instead.
 */
class TagDecoder {
public:
    /**
     * @brief Decode one for-each-ref line
     *
     * Fails with MalformedRecord on fewer than nine fields. For annotated
     * tags the target is the dereferenced commit (4th field), and a tagger
     * date that does not parse becomes the Unix epoch.
     */
    static Expected<Tag> decodeRefLine(const std::string& line);

    /// Decode the whole enumeration; malformed lines are skipped. Sorted by name.
    static Expected<TagList> decode(const std::string& output);

    /**
     * @brief Decode `git show --format=fuller <name>` output for one tag
     *
     * Fails with UnresolvedHash when no "commit <id>" line is present.
     * The fuller format carries no tagger epoch, so the tagger timestamp is
     * the Unix epoch.
     */
    static Expected<Tag> decodeShow(const std::string& name, const std::string& output);
};

}
