#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace gitquery {

/// Paths and approximate totals recovered from a human-readable --stat report
struct StatTotals {
    std::vector<std::string> files;
    size_t insertions{0};
    size_t deletions{0};
};

/**
 * @brief Lossy recovery of insertion/deletion counts from `--stat` graphs
 *
 * A stat line "path | 15 +++++++++------" only carries the combined count
 * and a scaled bar. The count is split across insertions and deletions in
 * the ratio of '+' to '-' glyphs, so per-file numbers are estimates. Exact
 * counts come from numstat; nothing on that path uses this class.
 */
class StatApproximation {
public:
    /**
     * @brief Split `changes` by glyph ratio
     *
     * insertions = changes * plus / (plus + minus), integer division;
     * deletions get the remainder. No glyphs -> {0, 0}.
     */
    static std::pair<size_t, size_t> approximateLineSplit(size_t changes, const std::string& glyphs);

    /// Walk a whole stat report; a summary line replaces the running totals
    static StatTotals approximateStatTotals(const std::string& output);
};

}
