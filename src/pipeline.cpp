#include "pipeline.hpp"

#include "errors.hpp"
#include "segmenter.hpp"
#include "strategy_detector.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace tablestitch {

std::string toString(ExtractionMode mode) {
  switch (mode) {
    case ExtractionMode::Hybrid: return "hybrid";
    case ExtractionMode::PageOnly: return "page_only";
    case ExtractionMode::LogicalOnly: return "logical_only";
  }
  return "hybrid";
}

ExtractionMode parseExtractionMode(const std::string& tag) {
  if (tag == "hybrid") return ExtractionMode::Hybrid;
  if (tag == "page_only") return ExtractionMode::PageOnly;
  if (tag == "logical_only") return ExtractionMode::LogicalOnly;
  throw InputError("unknown extraction mode '" + tag + "'");
}

std::vector<LogicalTable> RoutedTables::tablesFor(ExtractionMode mode) const {
  switch (mode) {
    case ExtractionMode::Hybrid: {
      std::vector<LogicalTable> all = pageTables;
      all.insert(all.end(), logicalTables.begin(), logicalTables.end());
      return all;
    }
    case ExtractionMode::PageOnly: return pageTables;
    case ExtractionMode::LogicalOnly: return logicalTables;
  }
  return {};
}

ConversionPipeline::ConversionPipeline(const ProfileRegistry& registry, ConversionOptions options,
                                       std::ostream& log)
  : registry_(registry), options_(std::move(options)), log_(log) {}

ConversionResult ConversionPipeline::convert(const DocumentInput& input) const {
  try {
    return run(input);
  } catch (const std::exception& ex) {
    log_ << "[Pipeline] Conversion failed: " << ex.what() << "\n";

    ConversionResult failed;
    failed.success = false;
    failed.errorMessage = ex.what();
    ValidationIssue issue;
    issue.severity = ValidationStatus::Failed;
    issue.message = std::string("Conversion failed: ") + ex.what();
    failed.report.addIssue(std::move(issue));
    failed.metadata.extractionMode = toString(options_.mode);
    failed.metadata.validationStatus = toString(failed.report.overallStatus());
    failed.metadata.validationIssuesCount = failed.report.issues().size();
    return failed;
  }
}

ConversionResult ConversionPipeline::run(const DocumentInput& input) const {
  ConversionResult result;

  auto match = registry_.detectProfile(input.fragments, input.pageTexts, input.context,
                                       options_.minProfileConfidence);
  const DocumentProfile* profile = match ? match->profile : nullptr;
  if (profile) {
    std::ostringstream pct;
    pct << std::fixed << std::setprecision(2) << match->detection.confidence * 100.0;
    log_ << "[Pipeline] Detected profile: " << profile->profileId() << " (confidence: " << pct.str() << "%)\n";
  } else {
    log_ << "[Pipeline] No profile detected, using generic processing\n";
  }

  result.tables.pageTables = buildPageTables(input.fragments);

  SegmentationStrategy strategy;
  std::vector<ScoreDomain> domains;
  if (options_.forcedStrategy) {
    strategy = *options_.forcedStrategy;
  } else if (profile) {
    strategy = profile->segmentationStrategy();
  } else {
    strategy = detectStrategy(input.fragments, options_.thresholds);
  }
  if (profile) domains = profile->scoreDomains().value_or(std::vector<ScoreDomain>{});
  result.strategy = strategy;

  result.tables.logicalTables = segmentFragments(input.fragments, strategy, domains, options_.thresholds);

  if (profile) {
    result.metadata = profile->extractMetadata(input.fragments, input.pageTexts, input.context);
    result.metadata.profileConfidence = match->detection.confidence;
  }
  result.metadata.extractionMode = toString(options_.mode);

  if (options_.validationEnabled) {
    TableValidator validator(options_.validation);
    result.report = validator.validateTables(result.tables.tablesFor(options_.mode));
  }
  result.metadata.validationStatus = toString(result.report.overallStatus());
  result.metadata.validationIssuesCount = result.report.issues().size();

  if (profile) result.summary = profile->summarize(result.tables.logicalTables);

  result.success = true;
  return result;
}

} // namespace tablestitch
