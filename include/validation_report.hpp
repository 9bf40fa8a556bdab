#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tablestitch {

// Ordered PASSED < WARNING < FAILED.
enum class ValidationStatus {
  Passed = 0,
  Warning = 1,
  Failed = 2,
};

// The more severe of the two; a status can only ever be raised through this.
ValidationStatus escalate(ValidationStatus current, ValidationStatus next);

// "passed" / "warning" / "failed"
std::string toString(ValidationStatus status);

struct ValidationIssue {
  ValidationStatus severity = ValidationStatus::Passed;
  std::string message;
  std::string tableName;
  std::optional<size_t> rowIndex;
  std::optional<std::string> columnName;
  nlohmann::json details = nlohmann::json::object();
};

// Aggregate outcome of one validation run over a document's tables.
// Issues are append-only and the overall status never moves down the lattice.
class ValidationReport {
public:
  using Clock = std::chrono::system_clock;

  explicit ValidationReport(Clock::time_point timestamp = Clock::now());

  void addIssue(ValidationIssue issue);
  // Counts one validated table under its worst severity.
  void recordTable(ValidationStatus worst);

  ValidationStatus overallStatus() const { return overallStatus_; }
  const std::vector<ValidationIssue>& issues() const { return issues_; }
  size_t tablesValidated() const { return tablesValidated_; }
  size_t tablesPassed() const { return tablesPassed_; }
  size_t tablesWithWarnings() const { return tablesWithWarnings_; }
  size_t tablesFailed() const { return tablesFailed_; }
  Clock::time_point timestamp() const { return timestamp_; }

  // Local time, "YYYY-MM-DDTHH:MM:SS".
  std::string timestampIso8601() const;

  // Audit layout: overall_status, issues, summary{...}, timestamp.
  nlohmann::json toJson() const;

private:
  ValidationStatus overallStatus_ = ValidationStatus::Passed;
  std::vector<ValidationIssue> issues_;
  size_t tablesValidated_ = 0;
  size_t tablesPassed_ = 0;
  size_t tablesWithWarnings_ = 0;
  size_t tablesFailed_ = 0;
  Clock::time_point timestamp_;
};

} // namespace tablestitch
