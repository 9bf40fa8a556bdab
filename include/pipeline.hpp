#pragma once

#include "fragment.hpp"
#include "profile.hpp"
#include "score_domain.hpp"
#include "validation_report.hpp"
#include "validator.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tablestitch {

enum class ExtractionMode {
  Hybrid,       // page-preserved tables followed by logical tables
  PageOnly,
  LogicalOnly,
};

// "hybrid" / "page_only" / "logical_only"
std::string toString(ExtractionMode mode);
// Throws InputError for an unknown tag.
ExtractionMode parseExtractionMode(const std::string& tag);

struct ConversionOptions {
  ExtractionMode mode = ExtractionMode::Hybrid;
  bool validationEnabled = true;
  ValidationConfig validation;
  double minProfileConfidence = ProfileRegistry::kDefaultMinConfidence;
  HeuristicThresholds thresholds;
  // Overrides both the matched profile's strategy and the detector.
  std::optional<SegmentationStrategy> forcedStrategy;
};

struct RoutedTables {
  std::vector<LogicalTable> pageTables;
  std::vector<LogicalTable> logicalTables;

  std::vector<LogicalTable> tablesFor(ExtractionMode mode) const;
};

// Everything the ingestion layer hands over for one document.
struct DocumentInput {
  std::vector<Fragment> fragments;
  std::vector<std::string> pageTexts;
  nlohmann::json context = nlohmann::json::object();
};

struct ConversionResult {
  bool success = false;
  RoutedTables tables;
  DocumentMetadata metadata;
  ValidationReport report;
  std::optional<SegmentationStrategy> strategy;
  std::optional<std::string> summary;
  std::optional<std::string> errorMessage;
};

// Runs one document through profile detection, segmentation and validation.
// Never throws: a failure inside a conversion comes back as success == false
// so the caller can move on to the next document.
class ConversionPipeline {
public:
  ConversionPipeline(const ProfileRegistry& registry, ConversionOptions options,
                     std::ostream& log = std::cerr);

  ConversionResult convert(const DocumentInput& input) const;

  const ConversionOptions& options() const { return options_; }

private:
  ConversionResult run(const DocumentInput& input) const;

  const ProfileRegistry& registry_;
  ConversionOptions options_;
  std::ostream& log_;
};

} // namespace tablestitch
