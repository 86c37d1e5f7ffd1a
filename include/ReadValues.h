#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "LogFileSet.h"

/// @file
/// Line-oriented reader for timing logs: one floating-point value per line.
/// Values are streamed in file order through a callback so callers decide
/// whether to materialize them; reading an unchanged file twice yields the
/// same sequence.

/// What to do with a line that is not a finite number.
enum class MalformedLinePolicy {
  Skip, ///< count it in the ParseReport and continue (default)
  Fail  ///< throw MalformedLineError
};

/// Location and raw text of one skipped line.
struct MalformedLine {
  std::string path;
  std::size_t lineNumber = 0;
  std::string content;
};

/// Only this many skipped lines are kept verbatim; the counter keeps going.
inline constexpr std::size_t kMaxRecordedMalformedLines = 16;

/// Diagnostics accumulated across every file read in one invocation.
struct ParseReport {
  std::size_t filesRead = 0;
  std::size_t valuesRead = 0;
  std::size_t skippedLines = 0;
  std::vector<MalformedLine> firstMalformed;

  void recordMalformed(const std::string &path, std::size_t lineNumber,
                       const std::string &content);
};

/// Parses a trimmed token as a finite double. Accepts a leading '+'.
bool parseValue(std::string_view token, double &value);

/// Streams every value of `path` into `onValue`. Blank lines are ignored.
/// @returns number of values delivered.
/// @throws NotFoundError if the file cannot be opened.
/// @throws MalformedLineError under MalformedLinePolicy::Fail.
std::size_t forEachValue(const std::filesystem::path &path,
                         const std::function<void(double)> &onValue,
                         MalformedLinePolicy policy = MalformedLinePolicy::Skip,
                         ParseReport *report = nullptr);

/// Reads a whole file into memory.
std::vector<double> readValueFile(const std::filesystem::path &path,
                                  ParseReport *report = nullptr,
                                  MalformedLinePolicy policy =
                                      MalformedLinePolicy::Skip);

/// Concatenates the values of every file in `set`, in resolver order.
std::vector<double> readFileSetValues(const LogFileSet &set,
                                      ParseReport *report = nullptr,
                                      MalformedLinePolicy policy =
                                          MalformedLinePolicy::Skip);

/// Prints the skipped-line count and the recorded lines, one per line.
/// Prints nothing when no line was skipped.
void printSkippedLines(std::ostream &out, const ParseReport &report);
