#include "Averager.h"

#include <numeric>
#include <string>
#include <vector>

#include "LogErrors.h"

double averageValues(std::span<const double> values) {
    if (values.empty())
        throw EmptyInputError("No values to average");
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double averageFileSet(const LogFileSet &set, MalformedLinePolicy policy,
                      ParseReport *report) {
    if (set.empty())
        throw EmptyInputError("No files match base name '" + set.baseName +
                              "' in " + set.directory.string());

    const std::vector<double> values = readFileSetValues(set, report, policy);
    if (values.empty())
        throw EmptyInputError("Files matching '" + set.baseName +
                              "' contain no valid values");
    return averageValues(values);
}

double averageRate(const LogFileSet &set, const BucketOptions &options,
                   ParseReport *report) {
    if (set.empty())
        throw EmptyInputError("No files match base name '" + set.baseName +
                              "' in " + set.directory.string());

    const BucketedCounts series = bucketFileSet(set, options, report);
    if (series.empty())
        throw EmptyInputError("No buckets left for '" +
                              set.baseName + "'");

    std::vector<double> rates;
    rates.reserve(series.size());
    for (const long long count : series.counts)
        rates.push_back(static_cast<double>(count) / series.bucketSeconds);
    return averageValues(rates);
}
