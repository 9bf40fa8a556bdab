#include "cell_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace tablestitch {

namespace {

std::optional<double> parseCleaned(const std::string& raw) {
  std::string cleaned = trim(raw);
  if (cleaned.empty()) return std::nullopt;
  // strtod would happily read hex floats; a table cell "0x1A" is not a score.
  if (cleaned.find_first_of("xX") != std::string::npos) return std::nullopt;

  const char* begin = cleaned.c_str();
  char* end = nullptr;
  errno = 0;
  double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
  if (!std::isfinite(value)) return std::nullopt;
  return value;
}

std::string without(const std::string& s, const std::string& chars) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    if (chars.find(ch) == std::string::npos) out.push_back(ch);
  }
  return out;
}

} // namespace

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

std::string toUpper(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

std::string toLower(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool isBlank(const std::string& cell) {
  return std::all_of(cell.begin(), cell.end(), [](unsigned char c) { return std::isspace(c); });
}

std::vector<std::string> normalizeRowKey(const std::vector<std::string>& row) {
  std::vector<std::string> key;
  key.reserve(row.size());
  for (const auto& cell : row) key.push_back(toUpper(trim(cell)));
  return key;
}

size_t countNonBlank(const std::vector<std::string>& row) {
  return static_cast<size_t>(std::count_if(row.begin(), row.end(),
                                           [](const std::string& c) { return !isBlank(c); }));
}

std::optional<double> parseNumber(const std::string& cell) {
  return parseCleaned(without(cell, ","));
}

std::optional<double> parseMeasure(const std::string& cell) {
  return parseCleaned(without(cell, ",%"));
}

std::string formatNumber(double value) {
  if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::ostringstream oss;
  oss << std::setprecision(15) << value;
  return oss.str();
}

} // namespace tablestitch
