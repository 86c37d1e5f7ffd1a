#include "CommandLine.h"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

CommandLine::CommandLine(int argc, char **argv, std::vector<OptionSpec> specs)
    : specs_(withCommonOptions(std::move(specs))) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string inlineValue;
    bool hasInlineValue = false;
    if (arg.rfind("--", 0) == 0) {
      const auto eq = arg.find('=');
      if (eq != std::string::npos) {
        inlineValue = arg.substr(eq + 1);
        arg = arg.substr(0, eq);
        hasInlineValue = true;
      }
    }

    const OptionSpec *opt = find(arg);
    if (!opt)
      throw std::invalid_argument("Unknown argument: " + arg);

    if (!opt->takesValue) {
      if (hasInlineValue)
        throw std::invalid_argument(opt->longName + " does not take a value");
      flags_.insert(opt->longName);
      continue;
    }

    if (hasInlineValue) {
      values_[opt->longName] = inlineValue;
    } else if (i + 1 < argc) {
      values_[opt->longName] = argv[++i];
    } else {
      throw std::invalid_argument("Missing value for " + arg);
    }
  }

  if (helpRequested() || versionRequested())
    return;
  for (const auto &opt : specs_) {
    if (opt.required && !values_.count(opt.longName)) {
      const std::string name = opt.shortName.empty()
                                   ? opt.longName
                                   : opt.shortName + "/" + opt.longName;
      throw std::invalid_argument("Missing required option " + name);
    }
  }
}

std::vector<OptionSpec>
CommandLine::withCommonOptions(std::vector<OptionSpec> specs) {
  specs.push_back({"-h", "--help", false, false, "Print this help."});
  specs.push_back({"", "--version", false, false, "Print version."});
  return specs;
}

const OptionSpec *CommandLine::find(const std::string &name) const {
  for (const auto &opt : specs_) {
    if (name == opt.longName || (!opt.shortName.empty() && name == opt.shortName))
      return &opt;
  }
  return nullptr;
}

bool CommandLine::has(const std::string &longName) const {
  return flags_.count(longName) > 0 || values_.count(longName) > 0;
}

std::string CommandLine::value(const std::string &longName,
                               const std::string &fallback) const {
  const auto it = values_.find(longName);
  return it != values_.end() ? it->second : fallback;
}

double CommandLine::positiveNumber(const std::string &longName,
                                   double fallback) const {
  const auto it = values_.find(longName);
  if (it == values_.end())
    return fallback;
  try {
    std::size_t idx = 0;
    const double v = std::stod(it->second, &idx);
    if (idx == it->second.size() && v > 0.0 && std::isfinite(v))
      return v;
  } catch (const std::logic_error &) {
    // stod reports bad input through invalid_argument/out_of_range.
  }
  throw std::invalid_argument("Invalid " + longName + " value '" + it->second +
                              "' (must be a positive number)");
}

int CommandLine::positiveInt(const std::string &longName, int fallback) const {
  const auto it = values_.find(longName);
  if (it == values_.end())
    return fallback;
  try {
    std::size_t idx = 0;
    const int v = std::stoi(it->second, &idx, 10);
    if (idx == it->second.size() && v > 0)
      return v;
  } catch (const std::logic_error &) {
    // Same as above; fall through to the uniform message.
  }
  throw std::invalid_argument("Invalid " + longName + " value '" + it->second +
                              "' (must be a positive integer)");
}

std::string CommandLine::describeOptions(const std::vector<OptionSpec> &specs) {
  std::ostringstream os;
  for (const auto &opt : withCommonOptions(specs)) {
    std::string names = opt.shortName.empty()
                            ? "      " + opt.longName
                            : "  " + opt.shortName + ", " + opt.longName;
    if (opt.takesValue)
      names += " <value>";
    os << names;
    if (names.size() < 32)
      os << std::string(32 - names.size(), ' ');
    else
      os << "  ";
    os << opt.help << (opt.required ? " (required)" : "") << "\n";
  }
  return os.str();
}
