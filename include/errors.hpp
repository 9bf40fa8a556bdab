#pragma once

#include <stdexcept>
#include <string>

namespace tablestitch {

class TableStitchError : public std::runtime_error {
public:
  explicit TableStitchError(const std::string& message) : std::runtime_error(message) {}
};

// Raised when a caller asks for a segmentation strategy that does not exist.
class UnknownStrategyError : public TableStitchError {
public:
  explicit UnknownStrategyError(const std::string& tag)
    : TableStitchError("Unknown segmentation strategy: " + tag) {}
};

// Raised by the JSON loaders when an input or options document is unusable.
class InputError : public TableStitchError {
public:
  explicit InputError(const std::string& message) : TableStitchError("Input error: " + message) {}
};

} // namespace tablestitch
