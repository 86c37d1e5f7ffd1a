#include "ReadValues.h"

// Value-per-line ingestion. Each line is trimmed and parsed with
// std::from_chars, which is locale-free and reports exactly how much of the
// token it consumed, so "5.0abc" is rejected rather than read as 5.0.

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "LogErrors.h"

namespace {

std::string_view trimmed(std::string_view text) {
  const char *begin = text.data();
  const char *end = begin + text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(*begin)))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(*(end - 1))))
    --end;
  return std::string_view(begin, static_cast<std::size_t>(end - begin));
}

} // namespace

void ParseReport::recordMalformed(const std::string &path,
                                  std::size_t lineNumber,
                                  const std::string &content) {
  ++skippedLines;
  if (firstMalformed.size() < kMaxRecordedMalformedLines)
    firstMalformed.push_back({path, lineNumber, content});
}

bool parseValue(std::string_view token, double &value) {
  token = trimmed(token);
  // from_chars does not take a leading '+', but log writers sometimes emit it.
  if (token.size() > 1 && token.front() == '+' && token[1] != '-' &&
      token[1] != '+')
    token.remove_prefix(1);
  if (token.empty())
    return false;

  double parsed = 0.0;
  const char *end = token.data() + token.size();
  const auto result = std::from_chars(token.data(), end, parsed);
  if (result.ec != std::errc() || result.ptr != end)
    return false;
  if (!std::isfinite(parsed))
    return false;
  value = parsed;
  return true;
}

std::size_t forEachValue(const std::filesystem::path &path,
                         const std::function<void(double)> &onValue,
                         MalformedLinePolicy policy, ParseReport *report) {
  std::ifstream file(path);
  if (!file.is_open())
    throw NotFoundError("Cannot open value file: " + path.string());

  std::string line;
  std::size_t lineNumber = 0;
  std::size_t delivered = 0;
  while (std::getline(file, line)) {
    ++lineNumber;
    const std::string_view token = trimmed(line);
    if (token.empty())
      continue;

    double value = 0.0;
    if (!parseValue(token, value)) {
      if (policy == MalformedLinePolicy::Fail)
        throw MalformedLineError(path.string(), lineNumber, line);
      if (report)
        report->recordMalformed(path.string(), lineNumber, line);
      continue;
    }

    onValue(value);
    ++delivered;
  }
  if (file.bad())
    throw std::runtime_error("Read error on value file: " + path.string());

  if (report) {
    ++report->filesRead;
    report->valuesRead += delivered;
  }
  return delivered;
}

std::vector<double> readValueFile(const std::filesystem::path &path,
                                  ParseReport *report,
                                  MalformedLinePolicy policy) {
  std::vector<double> values;
  forEachValue(
      path, [&values](double v) { values.push_back(v); }, policy, report);
  return values;
}

std::vector<double> readFileSetValues(const LogFileSet &set,
                                      ParseReport *report,
                                      MalformedLinePolicy policy) {
  std::vector<double> values;
  for (const auto &path : set.files) {
    forEachValue(
        path, [&values](double v) { values.push_back(v); }, policy, report);
  }
  return values;
}

void printSkippedLines(std::ostream &out, const ParseReport &report) {
  if (report.skippedLines == 0)
    return;
  out << "Skipped " << report.skippedLines << " malformed line"
      << (report.skippedLines == 1 ? "" : "s") << ":\n";
  for (const auto &bad : report.firstMalformed)
    out << "  " << bad.path << ":" << bad.lineNumber << ": '" << bad.content
        << "'\n";
  if (report.skippedLines > report.firstMalformed.size())
    out << "  ... " << report.skippedLines - report.firstMalformed.size()
        << " more\n";
}
