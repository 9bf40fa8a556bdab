#pragma once

#include "fragment.hpp"
#include "score_domain.hpp"

#include <optional>
#include <vector>

namespace tablestitch {

// All fragments' rows concatenated in fragment order. Page boundaries are
// deliberately lost; `pages` keeps the contributing pages in first-seen order.
struct MergedRows {
  std::vector<Row> rows;
  std::vector<int> pages;
};

MergedRows mergeFragments(const std::vector<Fragment>& fragments);

// Routes data rows to logical tables by the domain their leading value falls
// into. With no domains supplied the domains are detected from the data.
// A row matching several overlapping domains appears in each of their tables.
std::vector<LogicalTable> segmentByScoreDomain(const std::vector<Fragment>& fragments,
                                               const std::vector<ScoreDomain>& domains = {},
                                               const HeuristicThresholds& thresholds = {});

// Splits merged rows at every repetition of the document's recurring header
// row. Single-non-blank-cell rows become the section title of the next table.
std::vector<LogicalTable> segmentByHeaderRepetition(const std::vector<Fragment>& fragments,
                                                    const HeuristicThresholds& thresholds = {});

// Dispatches to the segmenter for `strategy`; with no strategy, detectStrategy
// decides. Throws UnknownStrategyError for an enumerator outside the set.
std::vector<LogicalTable> segmentFragments(const std::vector<Fragment>& fragments,
                                           std::optional<SegmentationStrategy> strategy,
                                           const std::vector<ScoreDomain>& domains = {},
                                           const HeuristicThresholds& thresholds = {});

// The first recurring all-non-blank row (normalized), if any.
std::optional<std::vector<std::string>> detectHeaderPattern(const std::vector<Row>& rows,
                                                            size_t minRepeats = 2);

// One table per page, fragments of the same page separated by a blank row.
std::vector<LogicalTable> buildPageTables(const std::vector<Fragment>& fragments);

} // namespace tablestitch
