#include "json_io.hpp"

#include "errors.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

namespace tablestitch {

namespace {

std::string cellText(const nlohmann::json& cell) {
  if (cell.is_string()) return cell.get<std::string>();
  if (cell.is_null()) return "";
  return cell.dump();
}

nlohmann::json optionalJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json readJsonFile(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw InputError("file not found: " + path);
  }
  std::ifstream ifs(path);
  if (!ifs) throw InputError("cannot open " + path);
  try {
    nlohmann::json j;
    ifs >> j;
    return j;
  } catch (const nlohmann::json::exception& ex) {
    throw InputError(path + ": " + ex.what());
  }
}

} // namespace

Fragment parseFragment(const nlohmann::json& j, size_t position) {
  if (!j.is_object()) {
    throw InputError("fragment " + std::to_string(position) + " is not an object");
  }
  Fragment f;
  f.page = j.value("page", 1);
  f.tableIndex = j.value("table_index", static_cast<int>(position));
  f.source = j.value("source", std::string());
  if (f.page < 1) {
    throw InputError("fragment " + std::to_string(position) + " has page " + std::to_string(f.page));
  }

  if (!j.contains("data")) return f;
  const auto& data = j.at("data");
  if (!data.is_array()) {
    throw InputError("fragment " + std::to_string(position) + ": data must be an array of rows");
  }
  for (const auto& row : data) {
    if (!row.is_array()) {
      throw InputError("fragment " + std::to_string(position) + ": every row must be an array");
    }
    Row cells;
    cells.reserve(row.size());
    for (const auto& cell : row) cells.push_back(cellText(cell));
    f.data.push_back(std::move(cells));
  }
  return f;
}

DocumentInput parseDocumentInput(const nlohmann::json& doc) {
  if (!doc.is_object()) throw InputError("document must be a JSON object");
  DocumentInput input;
  try {
    if (doc.contains("fragments")) {
      const auto& fragments = doc.at("fragments");
      if (!fragments.is_array()) throw InputError("'fragments' must be an array");
      for (size_t i = 0; i < fragments.size(); ++i) {
        input.fragments.push_back(parseFragment(fragments[i], i));
      }
    }
    if (doc.contains("page_texts")) {
      for (const auto& text : doc.at("page_texts")) input.pageTexts.push_back(cellText(text));
    }
    if (doc.contains("context") && doc.at("context").is_object()) {
      input.context = doc.at("context");
    }
  } catch (const nlohmann::json::exception& ex) {
    throw InputError(ex.what());
  }
  return input;
}

DocumentInput loadDocumentInput(const std::string& path) {
  return parseDocumentInput(readJsonFile(path));
}

nlohmann::json toJson(const ScoreDomain& domain) {
  return {
    {"name", domain.name},
    {"min_score", domain.minScore},
    {"max_score", domain.maxScore},
    {"description", domain.description},
  };
}

nlohmann::json toJson(const LogicalTable& table) {
  nlohmann::json j = {
    {"table_type", toString(table.tableType)},
    {"source_pages", table.sourcePages},
    {"schema", {
      {"headers", table.schema.headers},
      {"column_count", table.schema.columnCount},
      {"has_header", table.schema.hasHeader},
      {"header_row_indices", table.schema.headerRowIndices},
    }},
    {"segmentation_strategy", nullptr},
    {"section_title", optionalJson(table.sectionTitle)},
    {"score_domain", nullptr},
    {"data", table.data},
  };
  if (table.segmentationStrategy) j["segmentation_strategy"] = toString(*table.segmentationStrategy);
  if (table.scoreDomain) j["score_domain"] = toJson(*table.scoreDomain);
  return j;
}

nlohmann::json toJson(const DocumentMetadata& metadata) {
  return {
    {"title", optionalJson(metadata.title)},
    {"organization", optionalJson(metadata.organization)},
    {"reporting_period", optionalJson(metadata.reportingPeriod)},
    {"subject_or_code", optionalJson(metadata.subjectOrCode)},
    {"plugin_id", optionalJson(metadata.profileId)},
    {"plugin_version", optionalJson(metadata.profileVersion)},
    {"plugin_confidence", metadata.profileConfidence},
    {"extraction_mode", metadata.extractionMode},
    {"validation_status", optionalJson(metadata.validationStatus)},
    {"validation_issues_count", metadata.validationIssuesCount},
  };
}

nlohmann::json toJson(const ConversionResult& result) {
  nlohmann::json pageTables = nlohmann::json::array();
  for (const auto& t : result.tables.pageTables) pageTables.push_back(toJson(t));
  nlohmann::json logicalTables = nlohmann::json::array();
  for (const auto& t : result.tables.logicalTables) logicalTables.push_back(toJson(t));

  nlohmann::json j = {
    {"success", result.success},
    {"error_message", optionalJson(result.errorMessage)},
    {"segmentation_strategy", nullptr},
    {"metadata", toJson(result.metadata)},
    {"page_tables", std::move(pageTables)},
    {"logical_tables", std::move(logicalTables)},
    {"validation_report", result.report.toJson()},
    {"summary", optionalJson(result.summary)},
  };
  if (result.strategy) j["segmentation_strategy"] = toString(*result.strategy);
  return j;
}

void applyOptions(const nlohmann::json& j, ConversionOptions& options) {
  if (!j.is_object()) throw InputError("options must be a JSON object");
  try {
    if (j.contains("mode")) options.mode = parseExtractionMode(j.at("mode").get<std::string>());
    if (j.contains("validation_enabled")) options.validationEnabled = j.at("validation_enabled").get<bool>();
    if (j.contains("validation_tolerance")) options.validation.tolerance = j.at("validation_tolerance").get<double>();
    if (j.contains("distribution_keyword_min")) {
      options.validation.distributionKeywordMin = j.at("distribution_keyword_min").get<size_t>();
    }
    if (j.contains("min_profile_confidence")) {
      options.minProfileConfidence = j.at("min_profile_confidence").get<double>();
    }
    if (j.contains("numeric_ratio")) options.thresholds.numericRatio = j.at("numeric_ratio").get<double>();
    if (j.contains("domain_gap")) options.thresholds.domainGap = j.at("domain_gap").get<double>();
    if (j.contains("header_repeat_min")) options.thresholds.headerRepeatMin = j.at("header_repeat_min").get<size_t>();
    if (j.contains("strategy")) {
      const auto& s = j.at("strategy");
      if (s.is_null()) {
        options.forcedStrategy.reset();
      } else {
        options.forcedStrategy = parseSegmentationStrategy(s.get<std::string>());
      }
    }
  } catch (const nlohmann::json::exception& ex) {
    throw InputError(std::string("bad option value: ") + ex.what());
  }
}

void loadOptionsFile(const std::string& path, ConversionOptions& options) {
  applyOptions(readJsonFile(path), options);
}

} // namespace tablestitch
