#include "segmenter.hpp"

#include "cell_utils.hpp"
#include "errors.hpp"
#include "strategy_detector.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

namespace tablestitch {

namespace {

TableSchema headerSchema(const Row& header) {
  TableSchema schema;
  schema.headers = header;
  schema.columnCount = header.size();
  schema.hasHeader = true;
  schema.headerRowIndices = {0};
  return schema;
}

LogicalTable makeLogicalTable(const Row& header, std::vector<Row> body, const std::vector<int>& pages) {
  LogicalTable t;
  t.data.reserve(body.size() + 1);
  t.data.push_back(header);
  for (auto& r : body) t.data.push_back(std::move(r));
  t.schema = headerSchema(header);
  t.sourcePages = pages;
  t.tableType = TableType::Logical;
  return t;
}

// Whole merged input as one table, first row taken as the header.
std::vector<LogicalTable> singleLogicalTable(const MergedRows& merged) {
  if (merged.rows.empty()) return {};
  LogicalTable t;
  t.data = merged.rows;
  t.schema = headerSchema(merged.rows.front());
  t.sourcePages = merged.pages;
  t.tableType = TableType::Logical;
  return {std::move(t)};
}

bool isAllNonBlank(const Row& row) {
  return !row.empty() && std::none_of(row.begin(), row.end(), [](const std::string& c) { return isBlank(c); });
}

bool matchesPattern(const Row& row, const std::vector<std::string>& pattern) {
  return row.size() == pattern.size() && normalizeRowKey(row) == pattern;
}

std::optional<std::string> sectionTitleOf(const Row& row) {
  if (row.size() < 2 || countNonBlank(row) != 1) return std::nullopt;
  for (const auto& cell : row) {
    if (!isBlank(cell)) return trim(cell);
  }
  return std::nullopt;
}

} // namespace

MergedRows mergeFragments(const std::vector<Fragment>& fragments) {
  MergedRows merged;
  for (const auto& f : fragments) {
    if (f.data.empty()) continue;
    merged.rows.insert(merged.rows.end(), f.data.begin(), f.data.end());
    if (std::find(merged.pages.begin(), merged.pages.end(), f.page) == merged.pages.end()) {
      merged.pages.push_back(f.page);
    }
  }
  return merged;
}

std::vector<LogicalTable> segmentByScoreDomain(const std::vector<Fragment>& fragments,
                                               const std::vector<ScoreDomain>& domains,
                                               const HeuristicThresholds& thresholds) {
  MergedRows merged = mergeFragments(fragments);
  if (merged.rows.empty()) return {};

  const Row& header = merged.rows.front();
  const std::vector<Row> dataRows(merged.rows.begin() + 1, merged.rows.end());

  std::vector<ScoreDomain> active = domains;
  if (active.empty()) {
    active = ScoreDomainRegistry::detect(dataRows, thresholds.domainGap).domains();
  }

  std::vector<LogicalTable> tables;
  for (const auto& domain : active) {
    std::vector<Row> matched;
    for (const auto& row : dataRows) {
      if (row.empty()) continue;
      auto score = parseNumber(row[0]);
      if (score && domain.contains(*score)) matched.push_back(row);
    }
    if (matched.empty()) continue;

    LogicalTable t = makeLogicalTable(header, std::move(matched), merged.pages);
    t.segmentationStrategy = SegmentationStrategy::ScoreDomain;
    t.scoreDomain = domain;
    tables.push_back(std::move(t));
  }
  return tables;
}

std::optional<std::vector<std::string>> detectHeaderPattern(const std::vector<Row>& rows,
                                                            size_t minRepeats) {
  std::map<std::vector<std::string>, size_t> counts;
  std::vector<std::vector<std::string>> order;
  for (const auto& row : rows) {
    if (!isAllNonBlank(row)) continue;
    auto key = normalizeRowKey(row);
    auto it = counts.find(key);
    if (it == counts.end()) {
      counts.emplace(key, 1);
      order.push_back(std::move(key));
    } else {
      it->second++;
    }
  }
  for (const auto& key : order) {
    if (counts[key] >= minRepeats) return key;
  }
  return std::nullopt;
}

std::vector<LogicalTable> segmentByHeaderRepetition(const std::vector<Fragment>& fragments,
                                                    const HeuristicThresholds& thresholds) {
  MergedRows merged = mergeFragments(fragments);
  if (merged.rows.empty()) return {};

  auto pattern = detectHeaderPattern(merged.rows, thresholds.headerRepeatMin);
  if (!pattern) return singleLogicalTable(merged);

  std::vector<LogicalTable> tables;
  std::optional<Row> currentHeader;
  std::vector<Row> currentSection;
  std::optional<std::string> pendingTitle;

  auto flush = [&]() {
    if (!currentHeader || currentSection.empty()) return;
    LogicalTable t = makeLogicalTable(*currentHeader, std::move(currentSection), merged.pages);
    t.segmentationStrategy = SegmentationStrategy::HeaderRepetition;
    t.sectionTitle = pendingTitle;
    tables.push_back(std::move(t));
    currentSection.clear();
  };

  for (const auto& row : merged.rows) {
    if (row.empty()) continue;

    if (matchesPattern(row, *pattern)) {
      flush();
      currentHeader = row;
      currentSection.clear();
      pendingTitle.reset();
    } else if (auto title = sectionTitleOf(row)) {
      pendingTitle = std::move(title);
    } else if (currentHeader) {
      currentSection.push_back(row);
    }
    // Rows ahead of the first header have no table to belong to.
  }
  flush();

  if (tables.empty()) return singleLogicalTable(merged);
  return tables;
}

std::vector<LogicalTable> segmentFragments(const std::vector<Fragment>& fragments,
                                           std::optional<SegmentationStrategy> strategy,
                                           const std::vector<ScoreDomain>& domains,
                                           const HeuristicThresholds& thresholds) {
  const SegmentationStrategy chosen = strategy ? *strategy : detectStrategy(fragments, thresholds);
  switch (chosen) {
    case SegmentationStrategy::ScoreDomain:
      return segmentByScoreDomain(fragments, domains, thresholds);
    case SegmentationStrategy::HeaderRepetition:
      return segmentByHeaderRepetition(fragments, thresholds);
  }
  throw UnknownStrategyError(std::to_string(static_cast<int>(chosen)));
}

std::vector<LogicalTable> buildPageTables(const std::vector<Fragment>& fragments) {
  std::map<int, std::vector<Row>> pageRows;
  for (const auto& f : fragments) {
    if (f.data.empty()) continue;
    auto& rows = pageRows[f.page];
    if (!rows.empty()) rows.emplace_back(f.data.front().size());
    rows.insert(rows.end(), f.data.begin(), f.data.end());
  }

  std::vector<LogicalTable> tables;
  for (auto& kv : pageRows) {
    LogicalTable t;
    t.data = std::move(kv.second);
    const Row& first = t.data.front();

    if (isAllNonBlank(first)) {
      t.schema = headerSchema(first);
    } else {
      t.schema.hasHeader = false;
      t.schema.columnCount = first.size();
      for (size_t c = 0; c < first.size(); ++c) {
        t.schema.headers.push_back("Column_" + std::to_string(c + 1));
      }
    }
    t.sourcePages = {kv.first};
    t.tableType = TableType::PagePreserved;
    tables.push_back(std::move(t));
  }
  return tables;
}

} // namespace tablestitch
