// logplot: events per second of a log set as a line chart. Shown in a gnuplot
// window, or written to an image when -o is given.

#include <stdexcept>

#include "CommandLine.h"
#include "LogErrors.h"
#include "LogFileSet.h"
#include "ReadValues.h"
#include "SeriesPlotter.h"
#include "Tools.h"

namespace {

const std::vector<OptionSpec> kOptions = {
    {"-i", "--infile", true, true, "Base name shared by the timestamp logs."},
    {"-o", "--outfile", true, false,
     "Image to write (.png, .svg or .pdf); display when omitted."},
    {"-d", "--dir", true, false, "Directory to search (default: .)."},
    {"", "--title", true, false, "Chart title."},
    {"", "--width", true, false, "Image width in pixels (default: 800)."},
    {"", "--height", true, false, "Image height in pixels (default: 600)."},
    {"", "--bucket-seconds", true, false, "Bucket width (default: 1)."},
    {"", "--drop-partial", false, false,
     "Omit the first and last bucket, which cover a partial second."},
    {"", "--strict", false, false, "Fail on the first malformed line."},
};

void printUsage(std::ostream &os, const char *argv0) {
  os << "Usage: " << argv0 << " -i <base_name> [-o <image>] [options]\n\n"
     << CommandLine::describeOptions(kOptions);
}

} // namespace

int runLogPlot(int argc, char **argv, std::ostream &out, std::ostream &err) {
  ParseReport report;
  int status = 0;
  try {
    const CommandLine args(argc, argv, kOptions);
    if (args.helpRequested()) {
      printUsage(out, argv[0]);
      return 0;
    }
    if (args.versionRequested()) {
      out << "logplot v" << kLogRateVersion << "\n";
      return 0;
    }

    PlotOptions options;
    options.outputPath = args.value("--outfile");
    options.width = args.positiveInt("--width", options.width);
    options.height = args.positiveInt("--height", options.height);
    options.buckets.bucketSeconds =
        args.positiveNumber("--bucket-seconds", 1.0);
    options.buckets.edges = args.has("--drop-partial")
                                ? EdgePolicy::DropPartial
                                : EdgePolicy::KeepPartial;
    options.buckets.malformed = args.has("--strict")
                                    ? MalformedLinePolicy::Fail
                                    : MalformedLinePolicy::Skip;

    const LogFileSet set =
        resolveLogFileSet(args.value("--infile"), args.value("--dir", "."));
    options.title = args.value("--title", set.baseName + " events per second");
    err << "Reading " << set.size() << " file(s) matching '" << set.baseName
        << "'...\n";

    const BucketedCounts series = plotFileSet(set, options, &report);
    if (!options.outputPath.empty())
      err << "Saved " << series.size() << "-bucket chart to "
          << options.outputPath << "\n";
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
