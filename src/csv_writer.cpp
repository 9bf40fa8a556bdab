#include "csv_writer.hpp"

#include "errors.hpp"

#include <filesystem>
#include <fstream>

namespace tablestitch {

std::string csvEscape(const std::string& cell) {
  bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos || cell.find('\n') != std::string::npos;
  if (!needQuotes) return cell;
  std::string escaped = "\"";
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

std::vector<std::string> writeTablesAsCsv(const std::vector<LogicalTable>& tables, const std::string& outDir) {
  if (!std::filesystem::exists(outDir)) {
    std::filesystem::create_directories(outDir);
  }
  std::vector<std::string> written;
  for (size_t n = 0; n < tables.size(); ++n) {
    std::string filename = outDir + "/table_" + std::to_string(n + 1) + ".csv";
    std::ofstream ofs(filename);
    if (!ofs) throw TableStitchError("cannot write " + filename);

    for (const auto& row : tables[n].data) {
      for (size_t i = 0; i < row.size(); ++i) {
        ofs << csvEscape(row[i]);
        if (i + 1 < row.size()) ofs << ',';
      }
      ofs << "\n";
    }
    written.push_back(filename);
  }
  return written;
}

} // namespace tablestitch
