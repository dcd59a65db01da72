#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace scanplot {

// Base of every error raised while turning one file into tables.
// A ScanError aborts that file only.
class ScanError : public std::runtime_error {
 public:
  explicit ScanError(const std::string& what) : std::runtime_error(what) {}
};

// Scalar or coordinate field that does not parse, or a wrong marker line
// when marker validation is enabled.
class FormatError : public ScanError {
 public:
  FormatError(const std::string& what, std::size_t line)
      : ScanError("line " + std::to_string(line) + ": " + what), line_(line) {}

  std::size_t line() const { return line_; }

 private:
  std::size_t line_ = 0;
};

// End of input reached while a block was still incomplete.
class TruncatedBlockError : public ScanError {
 public:
  TruncatedBlockError(const std::string& what, std::size_t block_start_line)
      : ScanError("line " + std::to_string(block_start_line) + ": " + what),
        block_start_line_(block_start_line) {}

  std::size_t blockStartLine() const { return block_start_line_; }

 private:
  std::size_t block_start_line_ = 0;
};

// Coordinate arrays of unequal length under RaggedPolicy::Reject.
class RaggedTableError : public ScanError {
 public:
  explicit RaggedTableError(const std::string& what) : ScanError(what) {}
};

class IoError : public ScanError {
 public:
  explicit IoError(const std::string& what) : ScanError(what) {}
};

}  // namespace scanplot
