#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

/// @file
/// Error taxonomy shared by the resolver, parser, bucketer, averager and
/// plotter. Every tool catches these once in `main`, prints the message and
/// exits non-zero. Only `MalformedLineError` is ever recovered locally.

/// A directory could not be read, an input file could not be opened, or a
/// file set that the caller requires resolved to nothing.
class NotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// An averaging or bucketing operation has no valid numeric input left after
/// malformed lines were skipped.
class EmptyInputError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The plotter derived an empty series and refuses to render it.
class NoDataError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// One line of a value file that does not hold a finite floating-point number.
class MalformedLineError : public std::runtime_error {
public:
  MalformedLineError(std::string path, std::size_t lineNumber,
                     std::string content);

  const std::string &path() const { return path_; }
  /// 1-based.
  std::size_t lineNumber() const { return lineNumber_; }
  const std::string &content() const { return content_; }

private:
  std::string path_;
  std::size_t lineNumber_;
  std::string content_;
};
