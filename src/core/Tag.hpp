#pragma once

#include <optional>
#include <string>

#include "core/Author.hpp"
#include "core/Hash.hpp"
#include "core/RecordCollection.hpp"

namespace gitquery {

enum class TagType { Lightweight, Annotated };

const char* toString(TagType type);

/**
 * @brief One tag from `git for-each-ref refs/tags` or `git show <tag>`
 *
 * hash is the commit the tag points at; for annotated tags this is the
 * dereferenced object, not the tag object itself. message, tagger and
 * timestamp are only ever set on annotated tags.
 */
struct Tag {
    std::string name;
    Hash hash;
    TagType type{TagType::Lightweight};
    std::optional<std::string> message;
    std::optional<Author> tagger;
    std::optional<Timestamp> timestamp;

    bool isAnnotated() const { return type == TagType::Annotated; }
};

template <>
struct RecordTraits<Tag> {
    static constexpr bool kSortedByKey = true;
    static const std::string& key(const Tag& tag) { return tag.name; }
};

using TagList = RecordCollection<Tag>;

FilteredView<Tag> lightweightTags(const TagList& tags);
FilteredView<Tag> annotatedTags(const TagList& tags);

/// Tags pointing at the given commit
FilteredView<Tag> tagsForCommit(const TagList& tags, const Hash& commit);

size_t lightweightCount(const TagList& tags);
size_t annotatedCount(const TagList& tags);

}
