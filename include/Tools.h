#pragma once
#include <ostream>

/// @file
/// Entry points of the logavg, logbucket and logplot tools. Each `main` only
/// forwards to these with std::cout/std::cerr, so the drivers can be run
/// in-process with string streams. Results go to `out`; progress, skipped-line
/// diagnostics and errors go to `err`.
/// @returns process exit status: 0 on success, 1 on any fatal error.

int runLogAverage(int argc, char **argv, std::ostream &out, std::ostream &err);
int runLogBucket(int argc, char **argv, std::ostream &out, std::ostream &err);
int runLogPlot(int argc, char **argv, std::ostream &out, std::ostream &err);
