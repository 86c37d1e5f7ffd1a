#pragma once
#include <cstddef>
#include <numeric>
#include <vector>

/// @file
/// Event counts grouped into contiguous fixed-width time buckets. Bucket i
/// covers the closed-open interval
/// [baseSecond + (firstBucket + i) * bucketSeconds,
///  baseSecond + (firstBucket + i + 1) * bucketSeconds)
/// of the merged input, so the first and last bucket may cover only part of
/// an observed second.

/// Treatment of the first and last bucket, which usually hold a partial
/// second of activity.
enum class EdgePolicy {
    KeepPartial, ///< emit every observed bucket (default)
    DropPartial  ///< remove the first and last bucket
};

struct BucketedCounts {
    /// floor() of the smallest merged timestamp.
    long long baseSecond = 0;
    /// Buckets dropped from the front; 0 unless edges were trimmed.
    long long firstBucket = 0;
    double bucketSeconds = 1.0;
    std::vector<long long> counts;

    bool empty() const { return counts.empty(); }
    std::size_t size() const { return counts.size(); }
};

/// Sum of all bucket counts.
inline long long totalEvents(const BucketedCounts &series) {
    return std::accumulate(series.counts.begin(), series.counts.end(), 0LL);
}

/// Seconds between the earliest observed second and the start of `index`.
inline double bucketOffset(const BucketedCounts &series, std::size_t index) {
    return static_cast<double>(series.firstBucket +
                               static_cast<long long>(index)) *
           series.bucketSeconds;
}

/// Start of bucket `index`, in seconds since the epoch.
inline double bucketStart(const BucketedCounts &series, std::size_t index) {
    return static_cast<double>(series.baseSecond) + bucketOffset(series, index);
}

/// Copy of `series` without its first and last bucket. Series of two or
/// fewer buckets become empty.
inline BucketedCounts dropPartialEdges(const BucketedCounts &series) {
    BucketedCounts trimmed;
    trimmed.baseSecond = series.baseSecond;
    trimmed.bucketSeconds = series.bucketSeconds;
    if (series.counts.size() <= 2)
        return trimmed;
    trimmed.firstBucket = series.firstBucket + 1;
    trimmed.counts.assign(series.counts.begin() + 1, series.counts.end() - 1);
    return trimmed;
}

inline BucketedCounts applyEdgePolicy(const BucketedCounts &series,
                                      EdgePolicy policy) {
    return policy == EdgePolicy::DropPartial ? dropPartialEdges(series) : series;
}
