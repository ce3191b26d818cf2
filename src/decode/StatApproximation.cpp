#include "decode/StatApproximation.hpp"

#include <algorithm>

#include "decode/DiffDecoder.hpp"
#include "util/StringUtils.hpp"

namespace gitquery {

std::pair<size_t, size_t> StatApproximation::approximateLineSplit(size_t changes, const std::string& glyphs) {
    const size_t plus = static_cast<size_t>(std::count(glyphs.begin(), glyphs.end(), '+'));
    const size_t minus = static_cast<size_t>(std::count(glyphs.begin(), glyphs.end(), '-'));
    if (plus + minus == 0) {
        return {0, 0};
    }
    const size_t insertions = changes * plus / (plus + minus);
    return {insertions, changes - insertions};
}

StatTotals StatApproximation::approximateStatTotals(const std::string& output) {
    StatTotals totals;
    for (const std::string& raw : StringUtils::splitLines(output)) {
        const std::string line = StringUtils::trim(raw);
        if (line.empty()) continue;

        size_t pipe = line.find(" | ");
        if (pipe != std::string::npos) {
            totals.files.push_back(StringUtils::trim(line.substr(0, pipe)));

            // "15 +++++------"; binary entries ("Bin 0 -> 12 bytes") carry no count
            std::vector<std::string> tokens = StringUtils::splitWhitespace(line.substr(pipe + 3));
            size_t changes = 0;
            if (tokens.size() >= 2 && StringUtils::parseSize(tokens[0], changes)) {
                auto split = approximateLineSplit(changes, tokens[1]);
                totals.insertions += split.first;
                totals.deletions += split.second;
            }
            continue;
        }

        if (auto summary = DiffDecoder::parseStatSummary(line)) {
            totals.insertions = summary->insertions;
            totals.deletions = summary->deletions;
        }
    }
    return totals;
}

}
