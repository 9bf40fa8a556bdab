#pragma once

#include "score_domain.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tablestitch {

using Row = std::vector<std::string>;

// One raw table as handed over by the ingestion layer: a single page/location,
// before any cross-page reassembly.
struct Fragment {
  std::vector<Row> data;
  int page = 1;
  int tableIndex = 0;
  std::string source;
};

enum class SegmentationStrategy {
  ScoreDomain,
  HeaderRepetition,
};

enum class TableType {
  PagePreserved,
  Logical,
};

// "score_domain" / "header_repetition"
std::string toString(SegmentationStrategy strategy);
// Throws UnknownStrategyError for anything but the two known tags.
SegmentationStrategy parseSegmentationStrategy(const std::string& tag);

// "page_preserved" / "logical"
std::string toString(TableType type);

struct TableSchema {
  std::vector<std::string> headers;
  size_t columnCount = 0;
  bool hasHeader = true;
  std::vector<size_t> headerRowIndices;
};

struct LogicalTable {
  std::vector<Row> data;
  TableSchema schema;
  std::vector<int> sourcePages;
  TableType tableType = TableType::Logical;
  std::optional<SegmentationStrategy> segmentationStrategy;
  std::optional<std::string> sectionTitle;
  std::optional<ScoreDomain> scoreDomain;

  size_t rowCount() const { return data.size(); }
  bool empty() const { return data.empty(); }
};

} // namespace tablestitch
