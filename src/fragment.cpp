#include "fragment.hpp"

#include "errors.hpp"

namespace tablestitch {

std::string toString(SegmentationStrategy strategy) {
  switch (strategy) {
    case SegmentationStrategy::ScoreDomain: return "score_domain";
    case SegmentationStrategy::HeaderRepetition: return "header_repetition";
  }
  throw UnknownStrategyError(std::to_string(static_cast<int>(strategy)));
}

SegmentationStrategy parseSegmentationStrategy(const std::string& tag) {
  if (tag == "score_domain") return SegmentationStrategy::ScoreDomain;
  if (tag == "header_repetition") return SegmentationStrategy::HeaderRepetition;
  throw UnknownStrategyError(tag);
}

std::string toString(TableType type) {
  switch (type) {
    case TableType::PagePreserved: return "page_preserved";
    case TableType::Logical: return "logical";
  }
  return "logical";
}

} // namespace tablestitch
