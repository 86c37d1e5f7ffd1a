#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "TestSupport.h"
#include "Tools.h"

namespace {
using ToolFn = int (*)(int, char **, std::ostream &, std::ostream &);

struct ToolRun {
    int status = 0;
    std::string out;
    std::string err;
};

ToolRun runTool(ToolFn tool, const std::string &name,
                std::vector<std::string> words) {
    words.insert(words.begin(), name);
    std::vector<char *> argv;
    for (auto &w : words)
        argv.push_back(w.data());
    std::ostringstream out;
    std::ostringstream err;
    ToolRun run;
    run.status = tool(static_cast<int>(argv.size()), argv.data(), out, err);
    run.out = out.str();
    run.err = err.str();
    return run;
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}
} // namespace

void testAveragePrintsMean() {
    ScopedTempDir dir;
    dir.write("durations_1", "1.0\n2.0\n");
    dir.write("durations_2", "3.0\n");
    const ToolRun run = runTool(runLogAverage, "logavg",
                                {"-f", "durations_", "-d", dir.path().string()});
    assert(run.status == 0);
    assert(run.out == "2\n");
    assert(contains(run.err, "Found 2 file(s)"));
}

void testAverageNoMatchFails() {
    ScopedTempDir dir;
    const ToolRun run = runTool(runLogAverage, "logavg",
                                {"--filename", "nothing_", "--dir",
                                 dir.path().string()});
    assert(run.status == 1);
    assert(run.out.empty());
    assert(contains(run.err, "Error: No files match base name 'nothing_'"));
}

void testAverageDropPartialNeedsRate() {
    ScopedTempDir dir;
    dir.write("d_1", "1.0\n");
    const ToolRun run = runTool(runLogAverage, "logavg",
                                {"-f", "d_", "-d", dir.path().string(),
                                 "--drop-partial"});
    assert(run.status == 1);
    assert(contains(run.err, "require --rate"));
    assert(contains(run.err, "Usage:"));
}

void testAverageRateOption() {
    ScopedTempDir dir;
    dir.write("q_1", "10.0\n10.9\n");
    dir.write("q_2", "11.0\n11.9\n");
    const ToolRun run = runTool(runLogAverage, "logavg",
                                {"-f", "q_", "-d", dir.path().string(),
                                 "--rate"});
    assert(run.status == 0);
    assert(run.out == "2\n");
}

void testAverageReportsSkippedLinesOnFailure() {
    ScopedTempDir dir;
    dir.write("bad_1", "abc\nxyz\n");
    const ToolRun run = runTool(runLogAverage, "logavg",
                                {"-f", "bad_", "-d", dir.path().string()});
    assert(run.status == 1);
    assert(contains(run.err, "contain no valid values"));
    assert(contains(run.err, "Skipped 2 malformed lines"));
    assert(contains(run.err, "bad_1:1: 'abc'"));
}

void testMissingRequiredOption() {
    const ToolRun run = runTool(runLogAverage, "logavg", {});
    assert(run.status == 1);
    assert(contains(run.err, "Missing required option -f/--filename"));

    const ToolRun help = runTool(runLogBucket, "logbucket", {"--help"});
    assert(help.status == 0);
    assert(contains(help.out, "-o, --outfile"));
}

void testBucketRerunWithOutfileSharingBaseName() {
    ScopedTempDir dir;
    dir.write("verify_a", "10.0\n10.9\n");
    dir.write("verify_b", "11.0\n11.9\n12.0\n");
    const std::string outfile = (dir.path() / "verify_counts").string();
    const std::vector<std::string> args{"-i", "verify_", "-o", outfile, "-d",
                                        dir.path().string()};

    const ToolRun first = runTool(runLogBucket, "logbucket", args);
    assert(first.status == 0);
    assert(readWholeFile(outfile) == "2\n2\n1\n");

    const ToolRun second = runTool(runLogBucket, "logbucket", args);
    assert(second.status == 0);
    assert(contains(second.err, "Ignoring output file"));
    assert(readWholeFile(outfile) == "2\n2\n1\n");
}

void testBucketOnlyOutfileMatches() {
    ScopedTempDir dir;
    const auto outfile = dir.write("rate_out", "5\n");
    const ToolRun run = runTool(runLogBucket, "logbucket",
                                {"-i", "rate_", "-o", outfile.string(), "-d",
                                 dir.path().string()});
    assert(run.status == 1);
    assert(contains(run.err, "Error: No files match base name 'rate_'"));
    assert(readWholeFile(outfile) == "5\n");
}

void testBucketNoMatchFails() {
    ScopedTempDir dir;
    const auto outfile = dir.path() / "out.txt";
    const ToolRun run = runTool(runLogBucket, "logbucket",
                                {"-i", "absent_", "-o", outfile.string(), "-d",
                                 dir.path().string()});
    assert(run.status == 1);
    assert(contains(run.err, "No files match"));
    assert(!std::filesystem::exists(outfile));
}

void testBucketWithoutValidTimestamps() {
    ScopedTempDir dir;
    dir.write("t_1", "garbage\n");
    const auto outfile = dir.path() / "out.txt";
    const ToolRun run = runTool(runLogBucket, "logbucket",
                                {"-i", "t_", "-o", outfile.string(), "-d",
                                 dir.path().string()});
    assert(run.status == 1);
    assert(contains(run.err, "No valid timestamps in files matching 't_'"));
    assert(contains(run.err, "Skipped 1 malformed line:"));
    assert(!std::filesystem::exists(outfile));
}

void testBucketEverythingDropped() {
    ScopedTempDir dir;
    dir.write("t_1", "10.5\n11.5\n");
    const auto outfile = dir.path() / "out.txt";
    const ToolRun run = runTool(runLogBucket, "logbucket",
                                {"-i", "t_", "-o", outfile.string(), "-d",
                                 dir.path().string(), "--drop-partial"});
    assert(run.status == 1);
    assert(contains(run.err, "No buckets left after dropping partial edges"));
}

void testBucketStrictFailsOnMalformedLine() {
    ScopedTempDir dir;
    dir.write("t_1", "10.5\nnope\n");
    const auto outfile = dir.path() / "out.txt";
    const ToolRun run = runTool(runLogBucket, "logbucket",
                                {"-i", "t_", "-o", outfile.string(), "-d",
                                 dir.path().string(), "--strict"});
    assert(run.status == 1);
    assert(contains(run.err, "t_1:2"));
}

void testPlotWithoutDataFails() {
    ScopedTempDir dir;
    dir.write("p_1", "not a time\n");
    const auto image = dir.path() / "chart.png";
    const ToolRun run = runTool(runLogPlot, "logplot",
                                {"-i", "p_", "-o", image.string(), "-d",
                                 dir.path().string()});
    assert(run.status == 1);
    assert(contains(run.err, "yield no events to plot"));
    assert(contains(run.err, "Skipped 1 malformed line:"));
    assert(!std::filesystem::exists(image));

    const ToolRun none = runTool(runLogPlot, "logplot",
                                 {"-i", "zzz_", "-d", dir.path().string()});
    assert(none.status == 1);
    assert(contains(none.err, "No files match"));
}

int main() {
    testAveragePrintsMean();
    testAverageNoMatchFails();
    testAverageDropPartialNeedsRate();
    testAverageRateOption();
    testAverageReportsSkippedLinesOnFailure();
    testMissingRequiredOption();
    testBucketRerunWithOutfileSharingBaseName();
    testBucketOnlyOutfileMatches();
    testBucketNoMatchFails();
    testBucketWithoutValidTimestamps();
    testBucketEverythingDropped();
    testBucketStrictFailsOnMalformedLine();
    testPlotWithoutDataFails();
    std::cout << "All tool tests passed" << std::endl;
    return 0;
}
