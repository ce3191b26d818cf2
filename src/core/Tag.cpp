#include "core/Tag.hpp"

namespace gitquery {

const char* toString(TagType type) {
    switch (type) {
        case TagType::Lightweight: return "lightweight";
        case TagType::Annotated: return "annotated";
    }
    return "unknown";
}

FilteredView<Tag> lightweightTags(const TagList& tags) {
    return tags.filter([](const Tag& t) { return t.type == TagType::Lightweight; });
}

FilteredView<Tag> annotatedTags(const TagList& tags) {
    return tags.filter([](const Tag& t) { return t.type == TagType::Annotated; });
}

FilteredView<Tag> tagsForCommit(const TagList& tags, const Hash& commit) {
    return tags.filter([commit](const Tag& t) { return t.hash == commit; });
}

size_t lightweightCount(const TagList& tags) {
    return tags.count([](const Tag& t) { return t.type == TagType::Lightweight; });
}

size_t annotatedCount(const TagList& tags) {
    return tags.count([](const Tag& t) { return t.type == TagType::Annotated; });
}

}
