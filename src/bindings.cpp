#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "Averager.h"
#include "Buckets.h"
#include "IntervalBucketer.h"
#include "LogErrors.h"
#include "LogFileSet.h"
#include "ReadValues.h"
#include "SeriesPlotter.h"

// Pybind11 module exposing the same operations as the logavg/logbucket/logplot
// tools, for analysis notebooks. Functions that fill a ParseReport return it
// alongside the result as a tuple so Python callers can inspect skipped lines.

namespace py = pybind11;

PYBIND11_MODULE(lograte, m) {
  m.doc() = "Python bindings for the LogRate timing-log library";

  py::register_exception<NotFoundError>(m, "NotFoundError");
  py::register_exception<EmptyInputError>(m, "EmptyInputError");
  py::register_exception<NoDataError>(m, "NoDataError");
  py::register_exception<MalformedLineError>(m, "MalformedLineError",
                                             PyExc_ValueError);

  py::enum_<MalformedLinePolicy>(m, "MalformedLinePolicy")
      .value("SKIP", MalformedLinePolicy::Skip)
      .value("FAIL", MalformedLinePolicy::Fail);

  py::enum_<EdgePolicy>(m, "EdgePolicy")
      .value("KEEP_PARTIAL", EdgePolicy::KeepPartial)
      .value("DROP_PARTIAL", EdgePolicy::DropPartial);

  // --- Bind data types ---
  py::class_<LogFileSet>(m, "LogFileSet")
      .def(py::init<>())
      .def_readwrite("base_name", &LogFileSet::baseName)
      .def_readwrite("directory", &LogFileSet::directory)
      .def_readwrite("files", &LogFileSet::files)
      .def("__len__", &LogFileSet::size)
      .def("__repr__", [](const LogFileSet &s) {
        return "<LogFileSet base_name='" + s.baseName +
               "', files=" + std::to_string(s.files.size()) + ">";
      });

  py::class_<MalformedLine>(m, "MalformedLine")
      .def_readonly("path", &MalformedLine::path)
      .def_readonly("line_number", &MalformedLine::lineNumber)
      .def_readonly("content", &MalformedLine::content);

  py::class_<ParseReport>(m, "ParseReport")
      .def(py::init<>())
      .def_readonly("files_read", &ParseReport::filesRead)
      .def_readonly("values_read", &ParseReport::valuesRead)
      .def_readonly("skipped_lines", &ParseReport::skippedLines)
      .def_readonly("first_malformed", &ParseReport::firstMalformed);

  py::class_<BucketedCounts>(m, "BucketedCounts")
      .def(py::init<>())
      .def_readwrite("base_second", &BucketedCounts::baseSecond)
      .def_readwrite("first_bucket", &BucketedCounts::firstBucket)
      .def_readwrite("bucket_seconds", &BucketedCounts::bucketSeconds)
      .def_readwrite("counts", &BucketedCounts::counts)
      .def("total_events", &totalEvents)
      .def("__len__", &BucketedCounts::size)
      .def("__repr__", [](const BucketedCounts &b) {
        return "<BucketedCounts base_second=" + std::to_string(b.baseSecond) +
               ", buckets=" + std::to_string(b.counts.size()) + ">";
      });

  py::class_<BucketOptions>(m, "BucketOptions")
      .def(py::init<>())
      .def_readwrite("bucket_seconds", &BucketOptions::bucketSeconds)
      .def_readwrite("edges", &BucketOptions::edges)
      .def_readwrite("malformed", &BucketOptions::malformed);

  py::class_<PlotOptions>(m, "PlotOptions")
      .def(py::init<>())
      .def_readwrite("output_path", &PlotOptions::outputPath)
      .def_readwrite("title", &PlotOptions::title)
      .def_readwrite("width", &PlotOptions::width)
      .def_readwrite("height", &PlotOptions::height)
      .def_readwrite("buckets", &PlotOptions::buckets);

  // --- Discovery and parsing ---
  m.def("resolve_log_file_set", &resolveLogFileSet, py::arg("base_name"),
        py::arg("directory") = std::filesystem::path("."),
        "Find every regular file in `directory` whose name starts with "
        "`base_name`.");

  m.def(
      "read_value_file",
      [](const std::filesystem::path &path, MalformedLinePolicy policy) {
        ParseReport report;
        auto values = readValueFile(path, &report, policy);
        return std::make_pair(std::move(values), report);
      },
      py::arg("path"), py::arg("policy") = MalformedLinePolicy::Skip,
      "Read one value per line; returns (values, parse_report).");

  // --- Bucketing ---
  m.def(
      "bucket_timestamps",
      [](const std::vector<double> &timestamps, double bucketSeconds) {
        return bucketTimestamps(timestamps, bucketSeconds);
      },
      py::arg("timestamps"), py::arg("bucket_seconds") = 1.0,
      "Count timestamps into buckets starting at floor(min(timestamps)).");

  m.def(
      "bucket_file_set",
      [](const LogFileSet &set, const BucketOptions &options) {
        ParseReport report;
        auto series = bucketFileSet(set, options, &report);
        return std::make_pair(std::move(series), report);
      },
      py::arg("file_set"), py::arg("options") = BucketOptions{},
      "Pool and bucket the timestamps of a file set; returns "
      "(bucketed_counts, parse_report).");

  m.def("drop_partial_edges", &dropPartialEdges, py::arg("series"));
  m.def("write_counts_to_file", &writeCountsToFile, py::arg("series"),
        py::arg("filename"), "Write one count per line.");

  // --- Averages ---
  m.def(
      "average_values",
      [](const std::vector<double> &values) { return averageValues(values); },
      py::arg("values"), "Arithmetic mean of a list of values.");

  m.def(
      "average_file_set",
      [](const LogFileSet &set, MalformedLinePolicy policy) {
        ParseReport report;
        const double mean = averageFileSet(set, policy, &report);
        return std::make_pair(mean, report);
      },
      py::arg("file_set"), py::arg("policy") = MalformedLinePolicy::Skip,
      "Mean of all values of a file set; returns (mean, parse_report).");

  m.def(
      "average_rate",
      [](const LogFileSet &set, const BucketOptions &options) {
        ParseReport report;
        const double mean = averageRate(set, options, &report);
        return std::make_pair(mean, report);
      },
      py::arg("file_set"), py::arg("options") = BucketOptions{},
      "Mean events per second of a timestamp file set; returns "
      "(mean, parse_report).");

  // --- Plotting ---
  m.def("build_plot_script", &buildPlotScript, py::arg("series"),
        py::arg("options") = PlotOptions{});
  m.def("render_counts", &renderCounts, py::arg("series"),
        py::arg("options") = PlotOptions{},
        "Render a series through gnuplot (display or save).");
}
