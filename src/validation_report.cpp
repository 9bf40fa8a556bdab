#include "validation_report.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace tablestitch {

ValidationStatus escalate(ValidationStatus current, ValidationStatus next) {
  return static_cast<int>(next) > static_cast<int>(current) ? next : current;
}

std::string toString(ValidationStatus status) {
  switch (status) {
    case ValidationStatus::Passed: return "passed";
    case ValidationStatus::Warning: return "warning";
    case ValidationStatus::Failed: return "failed";
  }
  return "failed";
}

ValidationReport::ValidationReport(Clock::time_point timestamp) : timestamp_(timestamp) {}

void ValidationReport::addIssue(ValidationIssue issue) {
  overallStatus_ = escalate(overallStatus_, issue.severity);
  issues_.push_back(std::move(issue));
}

void ValidationReport::recordTable(ValidationStatus worst) {
  tablesValidated_++;
  switch (worst) {
    case ValidationStatus::Passed: tablesPassed_++; break;
    case ValidationStatus::Warning: tablesWithWarnings_++; break;
    case ValidationStatus::Failed: tablesFailed_++; break;
  }
}

std::string ValidationReport::timestampIso8601() const {
  std::time_t t = Clock::to_time_t(timestamp_);
  std::tm local{};
  localtime_r(&t, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  return oss.str();
}

nlohmann::json ValidationReport::toJson() const {
  nlohmann::json issues = nlohmann::json::array();
  for (const auto& issue : issues_) {
    nlohmann::json j = {
      {"severity", toString(issue.severity)},
      {"message", issue.message},
      {"table_name", issue.tableName},
      {"row_index", nullptr},
      {"column_name", nullptr},
      {"details", issue.details.is_null() ? nlohmann::json::object() : issue.details},
    };
    if (issue.rowIndex) j["row_index"] = *issue.rowIndex;
    if (issue.columnName) j["column_name"] = *issue.columnName;
    issues.push_back(std::move(j));
  }

  return {
    {"overall_status", toString(overallStatus_)},
    {"issues", std::move(issues)},
    {"summary", {
      {"tables_validated", tablesValidated_},
      {"tables_passed", tablesPassed_},
      {"tables_with_warnings", tablesWithWarnings_},
      {"tables_failed", tablesFailed_},
    }},
    {"timestamp", timestampIso8601()},
  };
}

} // namespace tablestitch
