#include "IntervalBucketer.h"

// Global bucketing of pooled timestamps. Boundaries come from the merged
// minimum, never from an individual file, so a worker that started late still
// lands in the same buckets as everyone else.

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace {

// 2^63: the first double past the long long range.
constexpr double kLongLongLimit = 9223372036854775808.0;

// Largest i with origin + i * bucketSeconds <= ts. The floor of the quotient
// can land one bucket early or late when the width is not representable
// (0.7 / 0.1 == 6.999...), so the estimate is corrected against the actual
// boundaries.
long long bucketIndex(double ts, double origin, double bucketSeconds) {
  if (bucketSeconds == 1.0)
    return static_cast<long long>(std::floor(ts) - origin);

  long long idx =
      static_cast<long long>(std::floor((ts - origin) / bucketSeconds));
  while (origin + static_cast<double>(idx + 1) * bucketSeconds <= ts)
    ++idx;
  while (idx > 0 && origin + static_cast<double>(idx) * bucketSeconds > ts)
    --idx;
  return idx;
}

void checkBucketWidth(double bucketSeconds) {
  if (!(bucketSeconds > 0.0) || !std::isfinite(bucketSeconds))
    throw std::invalid_argument("Bucket width must be a positive number of "
                                "seconds");
}

// All checks are done in double so no out-of-range value is ever cast.
void checkSpan(double minTs, double maxTs, double origin,
               double bucketSeconds) {
  const double last = std::floor(maxTs);
  if (origin < -kLongLongLimit || last >= kLongLongLimit) {
    const double stray = origin < -kLongLongLimit ? minTs : maxTs;
    throw std::length_error("Timestamp " + std::to_string(stray) +
                            " is out of range; check the inputs for stray "
                            "values");
  }
  if ((maxTs - origin) / bucketSeconds >= static_cast<double>(kMaxBuckets))
    throw std::length_error(
        "Timestamps span " + std::to_string(maxTs - minTs) +
        " s, more than " + std::to_string(kMaxBuckets) +
        " buckets; check the inputs for stray values");
}

} // namespace

BucketedCounts bucketTimestamps(std::span<const double> timestamps,
                                double bucketSeconds) {
  checkBucketWidth(bucketSeconds);

  BucketedCounts series;
  series.bucketSeconds = bucketSeconds;
  if (timestamps.empty())
    return series;

  const auto [minIt, maxIt] =
      std::minmax_element(timestamps.begin(), timestamps.end());
  const double origin = std::floor(*minIt);
  checkSpan(*minIt, *maxIt, origin, bucketSeconds);

  const long long lastIndex = bucketIndex(*maxIt, origin, bucketSeconds);
  series.baseSecond = static_cast<long long>(origin);
  series.counts.assign(static_cast<std::size_t>(lastIndex + 1), 0);
  for (const double ts : timestamps)
    ++series.counts[static_cast<std::size_t>(
        bucketIndex(ts, origin, bucketSeconds))];
  return series;
}

BucketedCounts bucketFileSet(const LogFileSet &set,
                             const BucketOptions &options,
                             ParseReport *report) {
  checkBucketWidth(options.bucketSeconds);
  const std::vector<double> pooled =
      readFileSetValues(set, report, options.malformed);
  return applyEdgePolicy(bucketTimestamps(pooled, options.bucketSeconds),
                         options.edges);
}

void writeCounts(std::ostream &out, const BucketedCounts &series) {
  for (const long long count : series.counts)
    out << count << "\n";
}

void writeCountsToFile(const BucketedCounts &series,
                       const std::string &filename) {
  std::ofstream out(filename, std::ios::out | std::ios::trunc);
  if (!out.is_open())
    throw std::runtime_error("Cannot open output file: " + filename);
  writeCounts(out, series);
  out.close();
  if (!out)
    throw std::runtime_error("Failed to write output file: " + filename);
}
