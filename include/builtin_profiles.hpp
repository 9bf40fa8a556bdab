#pragma once

#include "profile.hpp"

namespace tablestitch {

// Examination-council marks distribution reports (TASS/CASS statistics):
// score, frequency, percent and cumulative columns split across pages.
class MarksDistributionProfile : public DocumentProfile {
public:
  std::string profileId() const override { return "waec_marksdist"; }
  std::string version() const override { return "1.0.0"; }

  DetectionResult detect(const std::vector<Fragment>& fragments,
                         const std::vector<std::string>& pageTexts,
                         const nlohmann::json& context) const override;

  SegmentationStrategy segmentationStrategy() const override { return SegmentationStrategy::ScoreDomain; }
  std::optional<std::vector<ScoreDomain>> scoreDomains() const override;

  DocumentMetadata extractMetadata(const std::vector<Fragment>& fragments,
                                   const std::vector<std::string>& pageTexts,
                                   const nlohmann::json& context) const override;

  std::optional<std::string> summarize(const std::vector<LogicalTable>& tables) const override;
};

// Staff rosters whose column header repeats on every page, grouped by
// department title rows.
class StaffListProfile : public DocumentProfile {
public:
  std::string profileId() const override { return "international_staff_list"; }
  std::string version() const override { return "1.0.0"; }

  DetectionResult detect(const std::vector<Fragment>& fragments,
                         const std::vector<std::string>& pageTexts,
                         const nlohmann::json& context) const override;

  SegmentationStrategy segmentationStrategy() const override { return SegmentationStrategy::HeaderRepetition; }

  DocumentMetadata extractMetadata(const std::vector<Fragment>& fragments,
                                   const std::vector<std::string>& pageTexts,
                                   const nlohmann::json& context) const override;

  std::optional<std::string> summarize(const std::vector<LogicalTable>& tables) const override;
};

void registerBuiltinProfiles(ProfileRegistry& registry);

} // namespace tablestitch
