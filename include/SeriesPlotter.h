#pragma once
#include <string>

#include "Buckets.h"
#include "IntervalBucketer.h"
#include "LogFileSet.h"
#include "ReadValues.h"

/// @file
/// Renders a bucketed event-rate series through gnuplot. The x-axis is the
/// elapsed time since the earliest observed second, the y-axis the number of
/// events in each bucket.

struct PlotOptions {
    /// Image to write. Empty means display the chart interactively.
    std::string outputPath;
    std::string title = "Events per second";
    int width = 800;
    int height = 600;
    BucketOptions buckets;
};

/// gnuplot terminal matching the extension of `outputPath`
/// (svg, pdfcairo, otherwise pngcairo).
std::string terminalForOutput(const std::string &outputPath, int width,
                              int height);

/// Complete gnuplot script, data included inline as a datablock.
std::string buildPlotScript(const BucketedCounts &series,
                            const PlotOptions &options);

/// Returns the full path of `command` on PATH, or "" if not found.
std::string findExecutableInPath(const std::string &command);

/// Runs gnuplot on the series.
/// @throws NoDataError if `series` is empty.
/// @throws std::runtime_error if gnuplot is missing or fails.
void renderCounts(const BucketedCounts &series, const PlotOptions &options);

/// Buckets `set` and renders it; returns the rendered series.
/// @throws NoDataError if the derived series is empty; nothing is rendered.
BucketedCounts plotFileSet(const LogFileSet &set, const PlotOptions &options,
                           ParseReport *report = nullptr);
