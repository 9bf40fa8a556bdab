#include "strategy_detector.hpp"

#include "cell_utils.hpp"

#include <algorithm>
#include <utility>

namespace tablestitch {

bool hasNumericLeadColumn(const Fragment& fragment, double ratio) {
  size_t total = 0;
  size_t numeric = 0;
  for (size_t r = 1; r < fragment.data.size(); ++r) {
    const Row& row = fragment.data[r];
    if (row.empty()) continue;
    total++;
    if (parseNumber(row[0])) numeric++;
  }
  if (total == 0) return false;
  return static_cast<double>(numeric) >= ratio * static_cast<double>(total);
}

bool hasRepeatedFirstRow(const std::vector<Fragment>& fragments) {
  std::vector<std::vector<std::string>> seen;
  for (const auto& f : fragments) {
    if (f.data.empty()) continue;
    auto key = normalizeRowKey(f.data.front());
    if (std::find(seen.begin(), seen.end(), key) != seen.end()) return true;
    seen.push_back(std::move(key));
  }
  return false;
}

SegmentationStrategy detectStrategy(const std::vector<Fragment>& fragments,
                                    const HeuristicThresholds& thresholds) {
  for (const auto& f : fragments) {
    if (hasNumericLeadColumn(f, thresholds.numericRatio)) return SegmentationStrategy::ScoreDomain;
  }
  if (hasRepeatedFirstRow(fragments)) return SegmentationStrategy::HeaderRepetition;
  return SegmentationStrategy::HeaderRepetition;
}

} // namespace tablestitch
