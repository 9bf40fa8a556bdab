#pragma once

#include "fragment.hpp"

#include <string>
#include <vector>

namespace tablestitch {

// Quotes a cell when it holds a comma, quote or newline; quotes are doubled.
std::string csvEscape(const std::string& cell);

// Write tables into CSV files in outDir as table_<n>.csv (n from 1) and
// return the paths written. Throws TableStitchError if a file cannot be opened.
std::vector<std::string> writeTablesAsCsv(const std::vector<LogicalTable>& tables, const std::string& outDir);

} // namespace tablestitch
