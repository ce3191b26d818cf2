#include "cli/commands/TagCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"
#include "decode/TagDecoder.hpp"
#include "util/StringUtils.hpp"

namespace gitquery {

namespace {

void printTag(const Tag& tag) {
    std::cout << tag.name << " (" << toString(tag.type) << ") -> " << tag.hash.shortHash() << "\n";
}

}

Expected<void> TagCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = CommandArgs::parse(args, {"--annotated", "--lightweight"}, {"--contains", "--show"});
    if (!parsed) return parsed.error();
    const CommandArgs& opts = parsed.value();

    if (opts.has("--annotated") && opts.has("--lightweight")) {
        return Error{ErrorCode::InvalidArgs, "--annotated and --lightweight are mutually exclusive"};
    }

    auto input = readInput(ctx, opts);
    if (!input) return input.error();

    if (auto showName = opts.value("--show")) {
        auto tag = TagDecoder::decodeShow(*showName, input.value());
        if (!tag) return tag.error();
        printTag(tag.value());
        if (tag.value().tagger) {
            std::cout << "Tagger: " << tag.value().tagger->toString() << "\n";
        }
        if (tag.value().message) {
            std::cout << "\n";
            for (const std::string& line : StringUtils::splitLines(*tag.value().message)) {
                std::cout << "    " << line << "\n";
            }
        }
        return {};
    }

    auto tags = TagDecoder::decode(input.value());
    if (!tags) return tags.error();

    const bool annotated = opts.has("--annotated");
    const bool lightweight = opts.has("--lightweight");
    const auto contains = opts.value("--contains");
    auto selected = tags.value().filter([&](const Tag& t) {
        if (annotated && t.type != TagType::Annotated) return false;
        if (lightweight && t.type != TagType::Lightweight) return false;
        return !contains || t.name.find(*contains) != std::string::npos;
    });

    for (const Tag& tag : selected) {
        printTag(tag);
    }
    return {};
}

}
