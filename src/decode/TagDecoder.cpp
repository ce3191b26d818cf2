#include "decode/TagDecoder.hpp"

#include <vector>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"
#include "util/TimeUtils.hpp"

namespace gitquery {

namespace {

enum TagField {
    kName = 0,
    kObjectType,
    kObjectName,
    kDereferenced,
    kTaggerName,
    kTaggerEmail,
    kTaggerDate,
    kSubject,
    kBody
};

// "Name <email>" -> Author with the epoch sentinel as timestamp
std::optional<Author> parseIdentity(const std::string& text) {
    size_t open = text.find('<');
    size_t close = open == std::string::npos ? std::string::npos : text.find('>', open);
    if (close == std::string::npos) return std::nullopt;
    return Author{StringUtils::trim(text.substr(0, open)), text.substr(open + 1, close - open - 1),
                  TimeUtils::epochStart()};
}

}  // namespace

Expected<Tag> TagDecoder::decodeRefLine(const std::string& line) {
    std::vector<std::string> parts = StringUtils::splitN(line, Constants::TAG_FIELD_DELIMITER);
    if (parts.size() < Constants::TAG_FIELDS) {
        return Error{ErrorCode::MalformedRecord,
                     "Invalid for-each-ref format: expected " + std::to_string(Constants::TAG_FIELDS) +
                         " parts, got " + std::to_string(parts.size())};
    }

    Tag tag;
    tag.name = parts[kName];
    if (parts[kObjectType] == "tag") {
        tag.type = TagType::Annotated;
        tag.hash = Hash(parts[kDereferenced]);
    } else {
        tag.type = TagType::Lightweight;
        tag.hash = Hash(parts[kObjectName]);
        return tag;
    }

    if (!parts[kTaggerName].empty() && !parts[kTaggerEmail].empty()) {
        auto when = TimeUtils::parseEpochSeconds(parts[kTaggerDate]);
        Timestamp ts = when ? when.value() : TimeUtils::epochStart();
        if (!when) {
            Logger::instance().debug("tag: " + tag.name + ": " + when.error().message + ", using epoch");
        }
        tag.tagger = Author{parts[kTaggerName], parts[kTaggerEmail], ts};
        tag.timestamp = ts;
    }

    const std::string& subject = parts[kSubject];
    const std::string& body = parts[kBody];
    if (!subject.empty() || !body.empty()) {
        tag.message = StringUtils::trim(body.empty() ? subject : subject + "\n\n" + body);
    }
    return tag;
}

Expected<TagList> TagDecoder::decode(const std::string& output) {
    std::vector<Tag> tags;
    for (const std::string& raw : StringUtils::splitLines(output)) {
        const std::string line = StringUtils::trim(raw);
        if (line.empty()) continue;
        auto tag = decodeRefLine(line);
        if (!tag) {
            Logger::instance().debug("tag: skipping line: " + tag.error().message);
            continue;
        }
        tags.push_back(tag.take());
    }
    return TagList(std::move(tags));
}

Expected<Tag> TagDecoder::decodeShow(const std::string& name, const std::string& output) {
    const bool annotated = StringUtils::contains(output, "tag ") && StringUtils::contains(output, "Tagger:");

    Tag tag;
    tag.name = name;
    tag.type = annotated ? TagType::Annotated : TagType::Lightweight;

    bool inMessage = false;
    bool messageDone = false;
    std::vector<std::string> messageLines;
    for (const std::string& line : StringUtils::splitLines(output)) {
        if (StringUtils::startsWith(line, "commit ")) {
            std::vector<std::string> tokens = StringUtils::splitWhitespace(line);
            if (tokens.size() > 1 && tag.hash.empty()) {
                tag.hash = Hash(tokens[1]);
            }
            messageDone = true;
            if (!annotated) break;
            continue;
        }
        if (!annotated || messageDone) continue;

        if (StringUtils::startsWith(line, "Tagger:")) {
            tag.tagger = parseIdentity(StringUtils::trim(line.substr(std::string("Tagger:").size())));
        } else if (!inMessage && StringUtils::trim(line).empty()) {
            inMessage = true;
        } else if (inMessage) {
            messageLines.push_back(StringUtils::trim(line));
        }
    }

    if (tag.hash.empty()) {
        return Error{ErrorCode::UnresolvedHash, "Could not parse tag commit hash"};
    }

    if (annotated) {
        std::string message;
        for (size_t i = 0; i < messageLines.size(); ++i) {
            if (i > 0) message += '\n';
            message += messageLines[i];
        }
        message = StringUtils::trim(message);
        if (!message.empty()) tag.message = message;
        if (tag.tagger) tag.timestamp = tag.tagger->timestamp;
    }
    return tag;
}

}
