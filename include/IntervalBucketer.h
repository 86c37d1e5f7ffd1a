#pragma once
#include <cstddef>
#include <ostream>
#include <span>
#include <string>

#include "Buckets.h"
#include "LogFileSet.h"
#include "ReadValues.h"

/// @file
/// Merge-then-bucket: every timestamp of every file in a set is pooled first,
/// then counted into buckets whose boundaries derive from the global minimum.
/// Bucketing each file separately and summing afterwards would give file-local
/// boundaries, which is not what the per-second throughput of concurrent
/// workers means.

/// Upper bound on the number of buckets one invocation may allocate
/// (30 days at one-second resolution).
inline constexpr long long kMaxBuckets = 30LL * 24 * 3600;

struct BucketOptions {
  /// Width of one bucket; must be positive and finite.
  double bucketSeconds = 1.0;
  EdgePolicy edges = EdgePolicy::KeepPartial;
  MalformedLinePolicy malformed = MalformedLinePolicy::Skip;
};

/// Counts `timestamps` (any order) into buckets starting at
/// floor(min(timestamps)). An empty input gives an empty series.
/// @throws std::invalid_argument for a non-positive or non-finite width.
/// @throws std::length_error if the span needs more than kMaxBuckets buckets.
BucketedCounts bucketTimestamps(std::span<const double> timestamps,
                                double bucketSeconds = 1.0);

/// Pools the timestamps of every file in `set`, buckets them and applies
/// `options.edges`. The result may be empty; callers decide if that is fatal.
BucketedCounts bucketFileSet(const LogFileSet &set,
                             const BucketOptions &options = {},
                             ParseReport *report = nullptr);

/// One count per line, earliest bucket first.
void writeCounts(std::ostream &out, const BucketedCounts &series);

/// Writes `series` to `filename`, replacing its contents.
/// @throws std::runtime_error if the file cannot be opened or written.
void writeCountsToFile(const BucketedCounts &series,
                       const std::string &filename);
