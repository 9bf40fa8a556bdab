#include "validator.hpp"

#include "cell_utils.hpp"

#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <utility>

namespace tablestitch {

namespace {

const std::vector<std::string> kDistributionIndicators = {"frequency", "percent", "cumulative", "score", "mark"};
const std::vector<std::string> kRosterIndicators = {"name", "position", "department", "staff", "student", "employee"};

const std::vector<std::string> kPercentKeys = {"percent", "percentage", "%"};
const std::vector<std::string> kCumulativeKeys = {"cumulative", "cum", "cum."};
const std::vector<std::string> kFrequencyKeys = {"frequency", "freq", "f"};
const std::vector<std::string> kScoreKeys = {"score", "mark", "grade"};

std::vector<std::string> lowered(const std::vector<std::string>& headers) {
  std::vector<std::string> out;
  out.reserve(headers.size());
  for (const auto& h : headers) out.push_back(toLower(h));
  return out;
}

std::string fixed2(double v) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << v;
  return oss.str();
}

std::string headerName(const LogicalTable& table, size_t col) {
  return col < table.schema.headers.size() ? table.schema.headers[col] : std::string();
}

// Numeric value at `col` of data row `idx`, if the row is long enough and the cell parses.
std::optional<double> measureAt(const LogicalTable& table, size_t idx, size_t col) {
  const Row& row = table.data[idx];
  if (row.size() <= col) return std::nullopt;
  return parseMeasure(row[col]);
}

ValidationIssue issue(ValidationStatus severity, std::string message, const std::string& table) {
  ValidationIssue i;
  i.severity = severity;
  i.message = std::move(message);
  i.tableName = table;
  return i;
}

} // namespace

TableValidator::TableValidator(ValidationConfig config) : config_(config) {}

ValidationReport TableValidator::validateTables(const std::vector<LogicalTable>& tables,
                                                const std::vector<std::string>& names) const {
  ValidationReport report;
  for (size_t i = 0; i < tables.size(); ++i) {
    const std::string name = i < names.size() ? names[i] : "Table_" + std::to_string(i + 1);
    report.recordTable(validateTable(tables[i], name, report));
  }
  return report;
}

ValidationStatus TableValidator::validateTable(const LogicalTable& table, const std::string& name,
                                               ValidationReport& report) const {
  ValidationStatus worst = ValidationStatus::Passed;
  worst = escalate(worst, checkDuplicateRows(table, name, report));
  worst = escalate(worst, checkColumnConsistency(table, name, report));
  worst = escalate(worst, checkHeaderPresent(table, name, report));
  if (isDistributionTable(table, config_.distributionKeywordMin)) {
    worst = escalate(worst, checkDistribution(table, name, report));
  }
  if (isRosterTable(table)) {
    worst = escalate(worst, checkRoster(table, name, report));
  }
  return worst;
}

ValidationStatus TableValidator::checkDuplicateRows(const LogicalTable& table, const std::string& name,
                                                    ValidationReport& report) const {
  if (table.data.size() <= 1) return ValidationStatus::Passed;

  const size_t first = table.schema.hasHeader ? 1 : 0;
  std::set<std::vector<std::string>> seen;
  for (size_t idx = first; idx < table.data.size(); ++idx) {
    std::vector<std::string> key;
    key.reserve(table.data[idx].size());
    for (const auto& cell : table.data[idx]) key.push_back(trim(cell));

    if (countNonBlank(key) > 0 && seen.count(key)) {
      ValidationIssue i = issue(ValidationStatus::Failed, "Duplicate row found", name);
      i.rowIndex = idx;
      i.details = {{"row_content", key}};
      report.addIssue(std::move(i));
      return ValidationStatus::Failed;
    }
    seen.insert(std::move(key));
  }
  return ValidationStatus::Passed;
}

ValidationStatus TableValidator::checkColumnConsistency(const LogicalTable& table, const std::string& name,
                                                        ValidationReport& report) const {
  const size_t expected = table.schema.columnCount;
  ValidationStatus status = ValidationStatus::Passed;
  for (size_t idx = 0; idx < table.data.size(); ++idx) {
    const size_t actual = table.data[idx].size();
    if (actual == expected) continue;
    ValidationIssue i = issue(ValidationStatus::Warning,
                              "Inconsistent column count: expected " + std::to_string(expected) +
                                ", got " + std::to_string(actual),
                              name);
    i.rowIndex = idx;
    i.details = {{"expected", expected}, {"actual", actual}};
    report.addIssue(std::move(i));
    status = ValidationStatus::Warning;
  }
  return status;
}

ValidationStatus TableValidator::checkHeaderPresent(const LogicalTable& table, const std::string& name,
                                                    ValidationReport& report) const {
  if (table.schema.hasHeader || table.empty()) return ValidationStatus::Passed;
  ValidationIssue i = issue(ValidationStatus::Warning, "Table has no detected header", name);
  i.details = {{"rows", table.data.size()}};
  report.addIssue(std::move(i));
  return ValidationStatus::Warning;
}

ValidationStatus TableValidator::checkDistribution(const LogicalTable& table, const std::string& name,
                                                   ValidationReport& report) const {
  ValidationStatus status = ValidationStatus::Passed;
  const auto& headers = table.schema.headers;

  const auto percentCol = findColumn(headers, kPercentKeys);
  const auto cumulativeCol = findColumn(headers, kCumulativeKeys);
  const auto frequencyCol = findColumn(headers, kFrequencyKeys);
  const auto scoreCol = findColumn(headers, kScoreKeys);

  if (percentCol) {
    double total = 0.0;
    size_t counted = 0;
    for (size_t idx = 1; idx < table.data.size(); ++idx) {
      if (auto v = measureAt(table, idx, *percentCol)) {
        total += *v;
        counted++;
      }
    }
    const double allowed = config_.tolerance * 100.0;
    if (counted > 0 && std::fabs(total - 100.0) > allowed) {
      ValidationIssue i = issue(ValidationStatus::Failed,
                                "Percent column does not sum to 100.00 (got " + fixed2(total) + ")", name);
      i.columnName = headerName(table, *percentCol);
      i.details = {{"expected", 100.0}, {"actual", total}, {"tolerance", allowed}};
      report.addIssue(std::move(i));
      status = ValidationStatus::Failed;
    }
  }

  if (frequencyCol) {
    for (size_t idx = 1; idx < table.data.size(); ++idx) {
      auto v = measureAt(table, idx, *frequencyCol);
      if (!v || *v >= 0) continue;
      ValidationIssue i = issue(ValidationStatus::Failed, "Negative frequency found: " + formatNumber(*v), name);
      i.rowIndex = idx;
      i.columnName = headerName(table, *frequencyCol);
      report.addIssue(std::move(i));
      status = ValidationStatus::Failed;
    }
  }

  if (cumulativeCol) {
    std::optional<double> previous;
    for (size_t idx = 1; idx < table.data.size(); ++idx) {
      auto v = measureAt(table, idx, *cumulativeCol);
      if (!v) continue;
      if (previous && *v < *previous) {
        ValidationIssue i = issue(ValidationStatus::Failed,
                                  "Cumulative frequency not monotonic: " + formatNumber(*v) + " < " +
                                    formatNumber(*previous),
                                  name);
        i.rowIndex = idx;
        i.columnName = headerName(table, *cumulativeCol);
        report.addIssue(std::move(i));
        status = ValidationStatus::Failed;
      }
      previous = v;
    }
  }

  if (table.scoreDomain && scoreCol) {
    const ScoreDomain& domain = *table.scoreDomain;
    for (size_t idx = 1; idx < table.data.size(); ++idx) {
      auto v = measureAt(table, idx, *scoreCol);
      if (!v || domain.contains(*v)) continue;
      ValidationIssue i = issue(ValidationStatus::Warning,
                                "Score " + formatNumber(*v) + " outside domain range [" +
                                  formatNumber(domain.minScore) + ", " + formatNumber(domain.maxScore) + "]",
                                name);
      i.rowIndex = idx;
      i.columnName = headerName(table, *scoreCol);
      report.addIssue(std::move(i));
      status = escalate(status, ValidationStatus::Warning);
    }
  }

  return status;
}

ValidationStatus TableValidator::checkRoster(const LogicalTable& table, const std::string& name,
                                             ValidationReport& report) const {
  ValidationStatus status = ValidationStatus::Passed;
  for (size_t idx = 1; idx + 1 < table.data.size(); ++idx) {
    const Row& row = table.data[idx];
    if (countNonBlank(row) != 1 || countNonBlank(table.data[idx + 1]) != 1) continue;

    std::string content;
    for (const auto& cell : row) {
      if (!isBlank(cell)) { content = cell; break; }
    }
    ValidationIssue i = issue(ValidationStatus::Warning, "Possible orphan row detected", name);
    i.rowIndex = idx;
    i.details = {{"content", content}};
    report.addIssue(std::move(i));
    status = ValidationStatus::Warning;
  }
  return status;
}

bool TableValidator::isDistributionTable(const LogicalTable& table, size_t keywordMin) {
  if (table.empty()) return false;
  const auto headers = lowered(table.schema.headers);
  size_t matches = 0;
  for (const auto& indicator : kDistributionIndicators) {
    for (const auto& h : headers) {
      if (h.find(indicator) != std::string::npos) { matches++; break; }
    }
  }
  return matches >= keywordMin;
}

bool TableValidator::isRosterTable(const LogicalTable& table) {
  if (table.empty()) return false;
  for (const auto& h : lowered(table.schema.headers)) {
    for (const auto& indicator : kRosterIndicators) {
      if (h.find(indicator) != std::string::npos) return true;
    }
  }
  return false;
}

std::optional<size_t> TableValidator::findColumn(const std::vector<std::string>& headers,
                                                 const std::vector<std::string>& keywords) {
  const auto lower = lowered(headers);
  for (size_t idx = 0; idx < lower.size(); ++idx) {
    for (const auto& keyword : keywords) {
      if (lower[idx].find(keyword) != std::string::npos) return idx;
    }
  }
  return std::nullopt;
}

} // namespace tablestitch
