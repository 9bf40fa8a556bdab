#pragma once

#include "fragment.hpp"
#include "score_domain.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tablestitch {

struct DocumentMetadata {
  std::optional<std::string> title;
  std::optional<std::string> organization;
  std::optional<std::string> reportingPeriod;
  std::optional<std::string> subjectOrCode;

  std::optional<std::string> profileId;
  std::optional<std::string> profileVersion;
  double profileConfidence = 0.0;
  std::string extractionMode = "hybrid";

  std::optional<std::string> validationStatus;
  size_t validationIssuesCount = 0;
};

struct DetectionResult {
  std::string profileId;
  double confidence = 0.0;  // 0.0 .. 1.0
  nlohmann::json metadata = nlohmann::json::object();
};

// A recognizer for one known document type. It scores how well a document
// matches and, when chosen, supplies the segmentation strategy and domains.
class DocumentProfile {
public:
  virtual ~DocumentProfile() = default;

  virtual std::string profileId() const = 0;
  virtual std::string version() const = 0;

  virtual DetectionResult detect(const std::vector<Fragment>& fragments,
                                 const std::vector<std::string>& pageTexts,
                                 const nlohmann::json& context) const = 0;

  virtual SegmentationStrategy segmentationStrategy() const = 0;

  // Domains for score-domain segmentation; none means "detect from data".
  virtual std::optional<std::vector<ScoreDomain>> scoreDomains() const { return std::nullopt; }

  virtual DocumentMetadata extractMetadata(const std::vector<Fragment>& fragments,
                                           const std::vector<std::string>& pageTexts,
                                           const nlohmann::json& context) const = 0;

  // Short human-readable digest of the segmented tables, if the profile has one.
  virtual std::optional<std::string> summarize(const std::vector<LogicalTable>& tables) const {
    (void)tables;
    return std::nullopt;
  }
};

struct ProfileMatch {
  const DocumentProfile* profile = nullptr;
  DetectionResult detection;
};

// Ordered set of profiles. Built once by the caller and handed to the pipeline.
class ProfileRegistry {
public:
  static constexpr double kDefaultMinConfidence = 0.5;

  explicit ProfileRegistry(std::ostream& log);
  ProfileRegistry();

  ProfileRegistry(const ProfileRegistry&) = delete;
  ProfileRegistry& operator=(const ProfileRegistry&) = delete;

  void registerProfile(std::unique_ptr<DocumentProfile> profile);

  // The profile with the strictly highest confidence that also reaches
  // `minConfidence`; earlier registrations win ties. Profiles whose detect()
  // throws are logged and skipped.
  std::optional<ProfileMatch> detectProfile(const std::vector<Fragment>& fragments,
                                            const std::vector<std::string>& pageTexts,
                                            const nlohmann::json& context,
                                            double minConfidence = kDefaultMinConfidence) const;

  const DocumentProfile* findProfile(const std::string& profileId) const;
  std::vector<std::string> listProfiles() const;
  size_t size() const { return profiles_.size(); }

private:
  std::vector<std::unique_ptr<DocumentProfile>> profiles_;
  std::ostream* log_;
};

} // namespace tablestitch
