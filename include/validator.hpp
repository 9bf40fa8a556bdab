#pragma once

#include "fragment.hpp"
#include "validation_report.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tablestitch {

struct ValidationConfig {
  // Allowed drift of a percent column total, as a fraction of 100.
  double tolerance = 0.01;
  // Distribution header keywords needed before distribution rules apply.
  size_t distributionKeywordMin = 2;
};

// Runs the fixed rule chain over logical tables. Rules never throw: every
// finding becomes a ValidationIssue in the returned report.
class TableValidator {
public:
  explicit TableValidator(ValidationConfig config = {});

  // `names` defaults to Table_1, Table_2, ... for any position it does not cover.
  ValidationReport validateTables(const std::vector<LogicalTable>& tables,
                                  const std::vector<std::string>& names = {}) const;

  // Validates one table into `report` and returns its worst severity.
  ValidationStatus validateTable(const LogicalTable& table, const std::string& name,
                                 ValidationReport& report) const;

  const ValidationConfig& config() const { return config_; }

  static bool isDistributionTable(const LogicalTable& table, size_t keywordMin = 2);
  static bool isRosterTable(const LogicalTable& table);
  // First header (left to right) containing any keyword, case-insensitive.
  static std::optional<size_t> findColumn(const std::vector<std::string>& headers,
                                          const std::vector<std::string>& keywords);

private:
  ValidationStatus checkDuplicateRows(const LogicalTable& table, const std::string& name,
                                      ValidationReport& report) const;
  ValidationStatus checkColumnConsistency(const LogicalTable& table, const std::string& name,
                                          ValidationReport& report) const;
  ValidationStatus checkHeaderPresent(const LogicalTable& table, const std::string& name,
                                      ValidationReport& report) const;
  ValidationStatus checkDistribution(const LogicalTable& table, const std::string& name,
                                     ValidationReport& report) const;
  ValidationStatus checkRoster(const LogicalTable& table, const std::string& name,
                               ValidationReport& report) const;

  ValidationConfig config_;
};

} // namespace tablestitch
