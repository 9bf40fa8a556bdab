#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tablestitch {

// Named, inclusive score range used to route rows by their leading value.
struct ScoreDomain {
  std::string name;
  double minScore = 0.0;
  double maxScore = 0.0;
  std::string description;

  bool contains(double score) const { return minScore <= score && score <= maxScore; }
};

bool operator==(const ScoreDomain& a, const ScoreDomain& b);
bool operator!=(const ScoreDomain& a, const ScoreDomain& b);

// Tunable constants of the segmentation heuristics.
struct HeuristicThresholds {
  // Share of numeric first-column values that marks a fragment as a score table.
  double numericRatio = 0.70;
  // Sorted scores further apart than this start a new auto-detected domain.
  double domainGap = 5.0;
  // Occurrences needed before an all-non-blank row counts as a repeated header.
  size_t headerRepeatMin = 2;
};

// Immutable, ordered collection of score domains. Evaluation order is the
// order of construction; overlapping ranges are allowed.
class ScoreDomainRegistry {
public:
  ScoreDomainRegistry() = default;
  explicit ScoreDomainRegistry(std::vector<ScoreDomain> domains);

  const std::vector<ScoreDomain>& domains() const { return domains_; }
  bool empty() const { return domains_.empty(); }
  size_t size() const { return domains_.size(); }

  std::optional<ScoreDomain> find(const std::string& name) const;

  // Builds the registry from the leading numeric values of `dataRows`: values
  // are deduplicated, sorted, and split wherever two neighbours differ by more
  // than `gap`. Each group becomes "Score Range {min}-{max}".
  static ScoreDomainRegistry detect(const std::vector<std::vector<std::string>>& dataRows,
                                    double gap = HeuristicThresholds{}.domainGap);

private:
  std::vector<ScoreDomain> domains_;
};

} // namespace tablestitch
