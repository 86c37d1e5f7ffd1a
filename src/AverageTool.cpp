// logavg: mean over every file of a log set. By default the values are
// averaged as they are (per-operation durations, or count files written by
// logbucket); with --rate they are read as timestamps and the mean number of
// events per second is reported instead.

#include <iomanip>
#include <limits>
#include <stdexcept>

#include "Averager.h"
#include "CommandLine.h"
#include "LogErrors.h"
#include "LogFileSet.h"
#include "ReadValues.h"
#include "Tools.h"

namespace {

const std::vector<OptionSpec> kOptions = {
    {"-f", "--filename", true, true, "Base name shared by the log files."},
    {"-d", "--dir", true, false, "Directory to search (default: .)."},
    {"", "--rate", false, false,
     "Treat values as timestamps and average the events per second."},
    {"", "--bucket-seconds", true, false,
     "Bucket width for --rate (default: 1)."},
    {"", "--drop-partial", false, false,
     "With --rate, ignore the first and last (partial) bucket."},
    {"", "--strict", false, false, "Fail on the first malformed line."},
};

void printUsage(std::ostream &os, const char *argv0) {
  os << "Usage: " << argv0 << " -f <base_name> [options]\n\n"
     << CommandLine::describeOptions(kOptions);
}

} // namespace

int runLogAverage(int argc, char **argv, std::ostream &out,
                  std::ostream &err) {
  ParseReport report;
  int status = 0;
  try {
    const CommandLine args(argc, argv, kOptions);
    if (args.helpRequested()) {
      printUsage(out, argv[0]);
      return 0;
    }
    if (args.versionRequested()) {
      out << "logavg v" << kLogRateVersion << "\n";
      return 0;
    }

    const MalformedLinePolicy policy = args.has("--strict")
                                           ? MalformedLinePolicy::Fail
                                           : MalformedLinePolicy::Skip;
    if (!args.has("--rate") &&
        (args.has("--drop-partial") || args.has("--bucket-seconds")))
      throw std::invalid_argument(
          "--drop-partial and --bucket-seconds require --rate");

    const LogFileSet set =
        resolveLogFileSet(args.value("--filename"), args.value("--dir", "."));
    err << "Found " << set.size() << " file(s) matching '" << set.baseName
        << "'\n";

    double mean = 0.0;
    if (args.has("--rate")) {
      BucketOptions options;
      options.bucketSeconds = args.positiveNumber("--bucket-seconds", 1.0);
      options.edges = args.has("--drop-partial") ? EdgePolicy::DropPartial
                                                 : EdgePolicy::KeepPartial;
      options.malformed = policy;
      mean = averageRate(set, options, &report);
    } else {
      mean = averageFileSet(set, policy, &report);
    }

    out << std::setprecision(std::numeric_limits<double>::max_digits10)
        << mean << "\n";
  } catch (const std::invalid_argument &ex) {
    err << "Error: " << ex.what() << "\n";
    printUsage(err, argv[0]);
    status = 1;
  } catch (const std::exception &ex) {
    err << "Error: " << ex.what() << "\n";
    status = 1;
  }
  printSkippedLines(err, report);
  return status;
}
