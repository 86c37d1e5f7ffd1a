#include <cassert>
#include <iostream>
#include <string>

#include "LogErrors.h"
#include "LogFileSet.h"
#include "SeriesPlotter.h"
#include "TestSupport.h"

namespace {
bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

template <typename Fn> bool throwsNoData(Fn &&fn) {
    try {
        fn();
    } catch (const NoDataError &) {
        return true;
    }
    return false;
}
} // namespace

void testEmptyFileSetIsNoData() {
    ScopedTempDir dir;
    PlotOptions options;
    options.outputPath = (dir.path() / "chart.png").string();
    const LogFileSet set = resolveLogFileSet("absent_", dir.path());
    assert(throwsNoData([&] { plotFileSet(set, options); }));
    assert(!std::filesystem::exists(options.outputPath));
}

void testFilesWithoutTimestampsAreNoData() {
    ScopedTempDir dir;
    dir.write("ts_1", "not a number\n");
    dir.write("ts_2", "");
    PlotOptions options;
    options.outputPath = (dir.path() / "chart.png").string();
    assert(throwsNoData(
        [&] { plotFileSet(resolveLogFileSet("ts_", dir.path()), options); }));
}

void testEverythingDroppedIsNoData() {
    ScopedTempDir dir;
    dir.write("ts_1", "10.2\n11.7\n");
    PlotOptions options;
    options.outputPath = (dir.path() / "chart.png").string();
    options.buckets.edges = EdgePolicy::DropPartial;
    assert(throwsNoData(
        [&] { plotFileSet(resolveLogFileSet("ts_", dir.path()), options); }));
}

void testRenderEmptySeriesIsNoData() {
    assert(throwsNoData([] { renderCounts(BucketedCounts{}, PlotOptions{}); }));
}

void testScriptForImageOutput() {
    BucketedCounts series;
    series.baseSecond = 1000;
    series.counts = {2, 2, 1};
    PlotOptions options;
    options.outputPath = "/tmp/it's.png";
    options.title = "quote rate";

    const std::string script = buildPlotScript(series, options);
    assert(contains(script, "set terminal pngcairo size 800,600"));
    assert(contains(script, "set output '/tmp/it''s.png'"));
    assert(contains(script, "set title 'quote rate'"));
    assert(contains(script, "set ylabel 'Events per second'"));
    assert(contains(script, "$counts << EOD\n0 2\n1 2\n2 1\nEOD\n"));
    assert(contains(script, "plot $counts using 1:2 with linespoints"));
}

void testScriptForDisplay() {
    BucketedCounts series;
    series.counts = {4};
    const std::string script = buildPlotScript(series, PlotOptions{});
    assert(!contains(script, "set terminal"));
    assert(!contains(script, "set output"));
    assert(contains(script, "0 4\n"));
}

void testScriptUsesElapsedOffsets() {
    BucketedCounts series;
    series.baseSecond = 50;
    series.firstBucket = 1;
    series.bucketSeconds = 2.0;
    series.counts = {3, 5};
    const std::string script = buildPlotScript(series, PlotOptions{});
    assert(contains(script, "EOD\n2 3\n4 5\nEOD\n"));
    assert(!contains(script, "Events per second"));
}

void testTerminalFollowsExtension() {
    assert(terminalForOutput("a.svg", 640, 480) == "svg size 640,480");
    assert(terminalForOutput("a.PDF", 640, 480) == "pdfcairo");
    assert(terminalForOutput("a.png", 640, 480) == "pngcairo size 640,480");
    assert(terminalForOutput("noext", 10, 20) == "pngcairo size 10,20");
}

void testFindExecutable() {
    assert(findExecutableInPath("").empty());
    assert(findExecutableInPath("lograte-no-such-binary-xyz").empty());
    assert(!findExecutableInPath("sh").empty());
}

int main() {
    testEmptyFileSetIsNoData();
    testFilesWithoutTimestampsAreNoData();
    testEverythingDroppedIsNoData();
    testRenderEmptySeriesIsNoData();
    testScriptForImageOutput();
    testScriptForDisplay();
    testScriptUsesElapsedOffsets();
    testTerminalFollowsExtension();
    testFindExecutable();
    std::cout << "All plotting tests passed" << std::endl;
    return 0;
}
