// logbucket: pools the timestamps of every file of a log set and writes the
// number of events per second (one count per line, earliest second first).

#include <iomanip>
#include <stdexcept>

#include "CommandLine.h"
#include "IntervalBucketer.h"
#include "LogErrors.h"
#include "LogFileSet.h"
#include "ReadValues.h"
#include "Tools.h"

namespace {

const std::vector<OptionSpec> kOptions = {
    {"-i", "--infile", true, true, "Base name shared by the timestamp logs."},
    {"-o", "--outfile", true, true, "File to write the counts to."},
    {"-d", "--dir", true, false, "Directory to search (default: .)."},
    {"", "--bucket-seconds", true, false, "Bucket width (default: 1)."},
    {"", "--drop-partial", false, false,
     "Omit the first and last bucket, which cover a partial second."},
    {"", "--strict", false, false, "Fail on the first malformed line."},
};

void printUsage(std::ostream &os, const char *argv0) {
  os << "Usage: " << argv0 << " -i <base_name> -o <outfile> [options]\n\n"
     << CommandLine::describeOptions(kOptions);
}

} // namespace

int runLogBucket(int argc, char **argv, std::ostream &out, std::ostream &err) {
  ParseReport report;
  int status = 0;
  try {
    const CommandLine args(argc, argv, kOptions);
    if (args.helpRequested()) {
      printUsage(out, argv[0]);
      return 0;
    }
    if (args.versionRequested()) {
      out << "logbucket v" << kLogRateVersion << "\n";
      return 0;
    }

    BucketOptions options;
    options.bucketSeconds = args.positiveNumber("--bucket-seconds", 1.0);
    options.edges = args.has("--drop-partial") ? EdgePolicy::DropPartial
                                               : EdgePolicy::KeepPartial;
    options.malformed = args.has("--strict") ? MalformedLinePolicy::Fail
                                             : MalformedLinePolicy::Skip;

    const std::string outfile = args.value("--outfile");
    LogFileSet set =
        resolveLogFileSet(args.value("--infile"), args.value("--dir", "."));
    // A previous run's output may share the base name; never read it back.
    if (excludePath(set, outfile) > 0)
      err << "Ignoring output file " << outfile << " as input\n";
    if (set.empty())
      throw NotFoundError("No files match base name '" + set.baseName +
                          "' in " + set.directory.string());

    err << "Reading " << set.size() << " file(s) matching '" << set.baseName
        << "'...\n";
    const BucketedCounts series = bucketFileSet(set, options, &report);
    if (series.empty())
      throw EmptyInputError(report.valuesRead == 0
                                ? "No valid timestamps in files matching '" +
                                      set.baseName + "'"
                                : "No buckets left after dropping partial "
                                  "edges");

    writeCountsToFile(series, outfile);
    err << "Wrote " << series.size() << " bucket(s), " << totalEvents(series)
        << " event(s), starting at " << std::fixed << std::setprecision(3)
        << bucketStart(series, 0) << " to " << outfile << "\n";
    if (options.edges == EdgePolicy::KeepPartial && series.size() > 1)
      err << "Note: first and last bucket may cover a partial second\n";
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
