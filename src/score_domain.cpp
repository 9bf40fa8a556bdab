#include "score_domain.hpp"

#include "cell_utils.hpp"

#include <algorithm>
#include <utility>

namespace tablestitch {

bool operator==(const ScoreDomain& a, const ScoreDomain& b) {
  return a.name == b.name && a.minScore == b.minScore && a.maxScore == b.maxScore &&
         a.description == b.description;
}

bool operator!=(const ScoreDomain& a, const ScoreDomain& b) {
  return !(a == b);
}

ScoreDomainRegistry::ScoreDomainRegistry(std::vector<ScoreDomain> domains)
  : domains_(std::move(domains)) {}

std::optional<ScoreDomain> ScoreDomainRegistry::find(const std::string& name) const {
  for (const auto& d : domains_) {
    if (d.name == name) return d;
  }
  return std::nullopt;
}

ScoreDomainRegistry ScoreDomainRegistry::detect(const std::vector<std::vector<std::string>>& dataRows,
                                                double gap) {
  std::vector<double> scores;
  for (const auto& row : dataRows) {
    if (row.empty()) continue;
    if (auto v = parseNumber(row[0])) scores.push_back(*v);
  }
  if (scores.empty()) return ScoreDomainRegistry{};

  std::sort(scores.begin(), scores.end());
  scores.erase(std::unique(scores.begin(), scores.end()), scores.end());

  auto makeDomain = [](double lo, double hi) {
    ScoreDomain d;
    d.name = "Score Range " + formatNumber(lo) + "-" + formatNumber(hi);
    d.minScore = lo;
    d.maxScore = hi;
    return d;
  };

  std::vector<ScoreDomain> domains;
  double groupMin = scores.front();
  for (size_t i = 1; i < scores.size(); ++i) {
    if (scores[i] - scores[i-1] > gap) {
      domains.push_back(makeDomain(groupMin, scores[i-1]));
      groupMin = scores[i];
    }
  }
  domains.push_back(makeDomain(groupMin, scores.back()));
  return ScoreDomainRegistry(std::move(domains));
}

} // namespace tablestitch
