#include "core/Commit.hpp"

#include "util/StringUtils.hpp"

namespace gitquery {

std::string CommitMessage::full() const {
    if (!body) return subject;
    return subject + "\n\n" + *body;
}

std::optional<Hash> Commit::mainParent() const {
    if (parents.empty()) return std::nullopt;
    return parents.front();
}

bool Commit::isAuthoredBy(const std::string& text) const {
    return StringUtils::contains(author.name, text) || StringUtils::contains(author.email, text);
}

bool Commit::messageContains(const std::string& text) const {
    const std::string needle = StringUtils::toLower(text);
    if (StringUtils::contains(StringUtils::toLower(message.subject), needle)) return true;
    return message.body && StringUtils::contains(StringUtils::toLower(*message.body), needle);
}

std::string Commit::toString() const {
    return hash.shortHash() + " " + message.subject + " by " + author.name + " at " +
        TimeUtils::formatUtc(timestamp);
}

FilteredView<Commit> byAuthor(const CommitLog& log, const std::string& author) {
    return log.filter([author](const Commit& c) { return c.isAuthoredBy(author); });
}

FilteredView<Commit> since(const CommitLog& log, Timestamp since) {
    return log.filter([since](const Commit& c) { return c.timestamp >= since; });
}

FilteredView<Commit> until(const CommitLog& log, Timestamp until) {
    return log.filter([until](const Commit& c) { return c.timestamp <= until; });
}

FilteredView<Commit> withMessageContaining(const CommitLog& log, const std::string& text) {
    return log.filter([text](const Commit& c) { return c.messageContains(text); });
}

FilteredView<Commit> mergesOnly(const CommitLog& log) {
    return log.filter([](const Commit& c) { return c.isMerge(); });
}

FilteredView<Commit> noMerges(const CommitLog& log) {
    return log.filter([](const Commit& c) { return !c.isMerge(); });
}

const Commit* findByHash(const CommitLog& log, const Hash& hash) {
    return log.find(hash.str());
}

const Commit* findByShortHash(const CommitLog& log, const std::string& shortHash) {
    return log.filter([&shortHash](const Commit& c) { return c.hash.shortHash() == shortHash; }).first();
}

size_t mergeCount(const CommitLog& log) {
    return log.count([](const Commit& c) { return c.isMerge(); });
}

}
