#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

/// @file
/// Minimal option parser shared by logavg, logbucket and logplot.
/// Accepts `-x value`, `--long value`, `--long=value` and bare flags.

struct OptionSpec {
  std::string shortName; ///< e.g. "-f"; may be empty
  std::string longName;  ///< e.g. "--filename"
  bool takesValue = true;
  bool required = false;
  std::string help;
};

class CommandLine {
public:
  /// @throws std::invalid_argument on unknown options, missing values or
  /// missing required options. Help and version requests skip the
  /// required check.
  CommandLine(int argc, char **argv, std::vector<OptionSpec> specs);

  bool has(const std::string &longName) const;
  /// Value of `longName`, or `fallback` when absent.
  std::string value(const std::string &longName,
                    const std::string &fallback = "") const;
  /// @throws std::invalid_argument if the value is not a positive finite number.
  double positiveNumber(const std::string &longName, double fallback) const;
  /// @throws std::invalid_argument if the value is not a positive integer.
  int positiveInt(const std::string &longName, int fallback) const;

  bool helpRequested() const { return has("--help"); }
  bool versionRequested() const { return has("--version"); }

  /// Option table for a usage message, including --help and --version.
  static std::string describeOptions(const std::vector<OptionSpec> &specs);

private:
  static std::vector<OptionSpec> withCommonOptions(std::vector<OptionSpec> specs);
  const OptionSpec *find(const std::string &name) const;

  std::vector<OptionSpec> specs_;
  std::map<std::string, std::string> values_;
  std::set<std::string> flags_;
};

/// Version string printed by every tool.
inline constexpr const char *kLogRateVersion = "1.0";
