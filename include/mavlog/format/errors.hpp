#pragma once
#include <stdexcept>
#include <string>

namespace mavlog::format {

// Malformed bytes: short header, invalid enum value.
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// Well-formed file this build refuses to interpret.
class UnsupportedFileError : public std::runtime_error {
public:
  explicit UnsupportedFileError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace mavlog::format
