#include "builtin_profiles.hpp"

#include "cell_utils.hpp"
#include "segmenter.hpp"

#include <algorithm>
#include <memory>
#include <regex>
#include <sstream>

namespace tablestitch {

namespace {

std::string joinPages(const std::vector<std::string>& pageTexts) {
  std::string out;
  for (size_t i = 0; i < pageTexts.size(); ++i) {
    if (i) out += ' ';
    out += pageTexts[i];
  }
  return out;
}

size_t countContained(const std::string& haystack, const std::vector<std::string>& needles) {
  return static_cast<size_t>(std::count_if(needles.begin(), needles.end(), [&](const std::string& n) {
    return haystack.find(n) != std::string::npos;
  }));
}

// Keyword hits summed over every fragment's first row (cells joined, uppercased).
size_t firstRowKeywordHits(const std::vector<Fragment>& fragments, const std::vector<std::string>& keywords) {
  size_t hits = 0;
  for (const auto& f : fragments) {
    if (f.data.empty()) continue;
    std::string joined;
    for (const auto& cell : f.data.front()) joined += toUpper(cell) + " ";
    hits += countContained(joined, keywords);
  }
  return hits;
}

// More than 70% of a fragment's data rows lead with a number.
bool anyMostlyNumericFragment(const std::vector<Fragment>& fragments) {
  for (const auto& f : fragments) {
    if (f.data.size() <= 1) continue;
    const size_t rows = f.data.size() - 1;
    size_t numeric = 0;
    for (size_t r = 1; r < f.data.size(); ++r) {
      if (!f.data[r].empty() && parseNumber(f.data[r][0])) numeric++;
    }
    if (static_cast<double>(numeric) > static_cast<double>(rows) * 0.7) return true;
  }
  return false;
}

std::optional<std::string> firstGroup(const std::string& text, const std::regex& re, int group = 1) {
  std::smatch m;
  if (!std::regex_search(text, m, re)) return std::nullopt;
  return trim(m[group].str());
}

const std::regex kYearRe("\\b(20\\d{2})\\b");
const std::regex kSessionRe("(?:SESSION|YEAR)[:\\s]+(\\d{4})");

} // namespace

DetectionResult MarksDistributionProfile::detect(const std::vector<Fragment>& fragments,
                                                 const std::vector<std::string>& pageTexts,
                                                 const nlohmann::json& /*context*/) const {
  DetectionResult result;
  result.profileId = profileId();
  double confidence = 0.0;

  const std::string fullText = toUpper(joinPages(pageTexts));

  const size_t indicators = countContained(fullText, {"WAEC", "WEST AFRICAN EXAMINATIONS COUNCIL", "TASS", "CASS"});
  if (indicators > 0) confidence += 0.3 * static_cast<double>(std::min<size_t>(indicators, 2));

  if (firstRowKeywordHits(fragments, {"FREQUENCY", "PERCENT", "CUMULATIVE", "SCORE"}) >= 3) confidence += 0.4;

  if (anyMostlyNumericFragment(fragments)) confidence += 0.3;

  static const std::regex subjectRe("SUBJECT[:\\s]+([A-Z\\s]+)");
  if (auto subject = firstGroup(fullText, subjectRe)) result.metadata["subject"] = *subject;
  if (auto session = firstGroup(fullText, kSessionRe)) result.metadata["session"] = *session;

  if (fullText.find("OBJECTIVE") != std::string::npos) result.metadata["paper_type"] = "objective";
  if (fullText.find("ESSAY") != std::string::npos) result.metadata["paper_type"] = "essay";

  result.confidence = std::min(confidence, 1.0);
  return result;
}

std::optional<std::vector<ScoreDomain>> MarksDistributionProfile::scoreDomains() const {
  return std::vector<ScoreDomain>{
    {"Scaled_Objective", 0, 19, "Scaled Objective score range (0-19)"},
    {"Scaled_Essay", 15, 40, "Scaled Essay score range (15-40)"},
    {"Raw_Score_40", 0, 40, "Raw score range (0-40)"},
    {"Raw_Score_50", 0, 50, "Raw score range (0-50)"},
    {"Raw_Score_60", 0, 60, "Raw score range (0-60)"},
  };
}

DocumentMetadata MarksDistributionProfile::extractMetadata(const std::vector<Fragment>& /*fragments*/,
                                                           const std::vector<std::string>& pageTexts,
                                                           const nlohmann::json& /*context*/) const {
  const std::string fullText = joinPages(pageTexts);

  static const std::regex titleRe("(TASS|CASS)\\s+(?:AND\\s+)?(TASS|CASS)?\\s*.*?STATISTICS",
                                  std::regex::ECMAScript | std::regex::icase);
  static const std::regex subjectRe("SUBJECT[:\\s]+([A-Z\\s]+?)(?:\\s{2,}|\\n|$)");

  DocumentMetadata meta;
  meta.title = firstGroup(fullText, titleRe, 0).value_or("WAEC Marks Distribution");
  meta.organization = "West African Examinations Council (WAEC)";
  meta.reportingPeriod = firstGroup(fullText, kSessionRe);
  meta.subjectOrCode = firstGroup(fullText, subjectRe);
  meta.profileId = profileId();
  meta.profileVersion = version();
  return meta;
}

std::optional<std::string> MarksDistributionProfile::summarize(const std::vector<LogicalTable>& tables) const {
  std::ostringstream lines;
  bool any = false;
  for (const auto& t : tables) {
    if (!t.scoreDomain) continue;
    lines << "\n- " << t.scoreDomain->name << ": " << (t.rowCount() - 1) << " score entries";
    any = true;
  }
  if (!any) return std::nullopt;
  return "WAEC Marks Distribution Summary:" + lines.str();
}

DetectionResult StaffListProfile::detect(const std::vector<Fragment>& fragments,
                                         const std::vector<std::string>& pageTexts,
                                         const nlohmann::json& /*context*/) const {
  DetectionResult result;
  result.profileId = profileId();
  double confidence = 0.0;

  const std::string fullText = toUpper(joinPages(pageTexts));

  const size_t indicators = countContained(fullText, {"STAFF LIST", "STAFF ROSTER", "INTERNATIONAL STAFF", "PERSONNEL"});
  if (indicators > 0) confidence += 0.3 * static_cast<double>(std::min<size_t>(indicators, 2));

  if (firstRowKeywordHits(fragments, {"NAME", "POSITION", "DEPARTMENT", "NATIONALITY"}) >= 2) confidence += 0.3;

  if (auto pattern = detectHeaderPattern(mergeFragments(fragments).rows)) {
    confidence += 0.4;
    result.metadata["header_pattern"] = *pattern;
  }

  if (auto year = firstGroup(fullText, kYearRe)) result.metadata["year"] = *year;

  result.confidence = std::min(confidence, 1.0);
  return result;
}

DocumentMetadata StaffListProfile::extractMetadata(const std::vector<Fragment>& /*fragments*/,
                                                   const std::vector<std::string>& pageTexts,
                                                   const nlohmann::json& /*context*/) const {
  const std::string fullText = joinPages(pageTexts);

  static const std::regex titleRe("(INTERNATIONAL\\s+STAFF\\s+LIST.*?(?:\\d{4})?)",
                                  std::regex::ECMAScript | std::regex::icase);
  static const std::regex orgRe("(?:SCHOOL|COLLEGE|UNIVERSITY|ORGANIZATION)[:\\s]+([A-Z\\s&]+)",
                                std::regex::ECMAScript | std::regex::icase);

  DocumentMetadata meta;
  meta.title = firstGroup(fullText, titleRe).value_or("International Staff List");
  meta.organization = firstGroup(fullText, orgRe);
  meta.reportingPeriod = firstGroup(fullText, kYearRe);
  meta.profileId = profileId();
  meta.profileVersion = version();
  return meta;
}

std::optional<std::string> StaffListProfile::summarize(const std::vector<LogicalTable>& tables) const {
  if (tables.empty()) return std::nullopt;

  std::ostringstream sections;
  size_t total = 0;
  for (const auto& t : tables) {
    const size_t count = t.rowCount() > 0 ? t.rowCount() - 1 : 0;
    total += count;
    sections << "\n- " << t.sectionTitle.value_or("General") << ": " << count << " staff members";
  }
  return "International Staff List Summary:\nTotal Staff: " + std::to_string(total) +
         "\n\nBy Section:" + sections.str();
}

void registerBuiltinProfiles(ProfileRegistry& registry) {
  registry.registerProfile(std::make_unique<MarksDistributionProfile>());
  registry.registerProfile(std::make_unique<StaffListProfile>());
}

} // namespace tablestitch
