#include "profile.hpp"

#include <iostream>
#include <utility>

namespace tablestitch {

ProfileRegistry::ProfileRegistry(std::ostream& log) : log_(&log) {}

ProfileRegistry::ProfileRegistry() : log_(&std::cerr) {}

void ProfileRegistry::registerProfile(std::unique_ptr<DocumentProfile> profile) {
  if (!profile) return;
  profiles_.push_back(std::move(profile));
}

std::optional<ProfileMatch> ProfileRegistry::detectProfile(const std::vector<Fragment>& fragments,
                                                           const std::vector<std::string>& pageTexts,
                                                           const nlohmann::json& context,
                                                           double minConfidence) const {
  std::optional<ProfileMatch> best;
  double bestConfidence = 0.0;

  for (const auto& profile : profiles_) {
    DetectionResult result;
    try {
      result = profile->detect(fragments, pageTexts, context);
    } catch (const std::exception& ex) {
      *log_ << "[ProfileRegistry] Error in profile " << profile->profileId() << ": " << ex.what() << "\n";
      continue;
    }

    if (result.confidence > bestConfidence && result.confidence >= minConfidence) {
      bestConfidence = result.confidence;
      best = ProfileMatch{profile.get(), std::move(result)};
    }
  }
  return best;
}

const DocumentProfile* ProfileRegistry::findProfile(const std::string& profileId) const {
  for (const auto& profile : profiles_) {
    if (profile->profileId() == profileId) return profile.get();
  }
  return nullptr;
}

std::vector<std::string> ProfileRegistry::listProfiles() const {
  std::vector<std::string> ids;
  ids.reserve(profiles_.size());
  for (const auto& profile : profiles_) ids.push_back(profile->profileId());
  return ids;
}

} // namespace tablestitch
