#pragma once
#include <span>

#include "IntervalBucketer.h"
#include "LogFileSet.h"
#include "ReadValues.h"

/// @file
/// Means over a file set. `averageFileSet` treats every value as directly
/// averageable (raw durations, or a bucketed count file written by
/// logbucket); `averageRate` derives per-second rates from raw timestamps
/// first.

/// Arithmetic mean of `values`.
/// @throws EmptyInputError if `values` is empty.
double averageValues(std::span<const double> values);

/// Mean of the concatenated values of every file in `set`.
/// @throws EmptyInputError if the set has no files or no valid values.
double averageFileSet(const LogFileSet &set,
                      MalformedLinePolicy policy = MalformedLinePolicy::Skip,
                      ParseReport *report = nullptr);

/// Mean events per second over the buckets of `set`, after `options.edges`.
/// @throws EmptyInputError if no bucket remains.
double averageRate(const LogFileSet &set, const BucketOptions &options = {},
                   ParseReport *report = nullptr);
