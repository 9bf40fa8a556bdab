#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tablestitch {

std::string trim(const std::string& s);
std::string toUpper(const std::string& s);
std::string toLower(const std::string& s);

bool isBlank(const std::string& cell);

// Trimmed, uppercased cells; used as the identity of a header-like row.
std::vector<std::string> normalizeRowKey(const std::vector<std::string>& row);

size_t countNonBlank(const std::vector<std::string>& row);

// Number in a segmentation cell: commas removed, surrounding whitespace ignored.
// Returns std::nullopt for anything that is not a finite decimal number.
std::optional<double> parseNumber(const std::string& cell);

// Number in a validation cell: like parseNumber, but '%' signs are removed too.
std::optional<double> parseMeasure(const std::string& cell);

// Shortest text form of a number: integral values lose their ".0".
std::string formatNumber(double value);

} // namespace tablestitch
