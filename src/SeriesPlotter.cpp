#include "SeriesPlotter.h"

// gnuplot front end. The script carries the series inline as a datablock, so
// a render needs exactly one temporary file (the script) which is removed
// again whatever the outcome.

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "LogErrors.h"

extern char **environ;

namespace fs = std::filesystem;

namespace {

std::string lowerExtension(const std::string &path) {
  std::string ext = fs::path(path).extension().string();
  for (char &c : ext)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

std::string quoteForGnuplot(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('\'');
  for (char ch : value) {
    if (ch == '\'')
      escaped += "''";
    else
      escaped.push_back(ch);
  }
  escaped.push_back('\'');
  return escaped;
}

class ScopedFile {
public:
  explicit ScopedFile(fs::path path) : path_(std::move(path)) {}
  ~ScopedFile() {
    std::error_code ec;
    fs::remove(path_, ec);
  }
  ScopedFile(const ScopedFile &) = delete;
  ScopedFile &operator=(const ScopedFile &) = delete;

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

int spawnAndWait(const std::vector<std::string> &args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);

  pid_t pid = -1;
  const int spawnRc = ::posix_spawn(&pid, args.front().c_str(), nullptr,
                                    nullptr, argv.data(), environ);
  if (spawnRc != 0 || pid <= 0)
    return -1;

  int status = 0;
  if (::waitpid(pid, &status, 0) < 0)
    return -1;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  return -1;
}

} // namespace

std::string terminalForOutput(const std::string &outputPath, int width,
                              int height) {
  const std::string size =
      " size " + std::to_string(width) + "," + std::to_string(height);
  const std::string ext = lowerExtension(outputPath);
  if (ext == ".svg")
    return "svg" + size;
  if (ext == ".pdf")
    return "pdfcairo";
  return "pngcairo" + size;
}

std::string buildPlotScript(const BucketedCounts &series,
                            const PlotOptions &options) {
  std::ostringstream script;
  if (!options.outputPath.empty()) {
    script << "set terminal "
           << terminalForOutput(options.outputPath, options.width,
                                options.height)
           << " enhanced\n";
    script << "set output " << quoteForGnuplot(options.outputPath) << "\n";
  }
  script << "set title " << quoteForGnuplot(options.title) << "\n";
  script << "set xlabel 'Elapsed time since first event (s)'\n";
  if (series.bucketSeconds == 1.0) {
    script << "set ylabel 'Events per second'\n";
  } else {
    std::ostringstream label;
    label << "Events per " << series.bucketSeconds << " s";
    script << "set ylabel " << quoteForGnuplot(label.str()) << "\n";
  }
  script << "set grid back lc rgb '#e5e7eb' lw 1 dt 2\n";
  script << "set key off\n";
  script << "set yrange [0:*]\n";
  script << "set style line 1 lc rgb '#2563eb' lw 2 pt 7 ps 1\n";

  script << "$counts << EOD\n";
  for (std::size_t i = 0; i < series.size(); ++i)
    script << bucketOffset(series, i) << " " << series.counts[i] << "\n";
  script << "EOD\n";
  script << "plot $counts using 1:2 with linespoints ls 1\n";
  return script.str();
}

std::string findExecutableInPath(const std::string &command) {
  if (command.empty())
    return "";
  const char *pathEnv = std::getenv("PATH");
  if (!pathEnv)
    return "";

  std::stringstream ss{std::string(pathEnv)};
  std::string token;
  while (std::getline(ss, token, ':')) {
    if (token.empty())
      token = ".";
    const fs::path candidate = fs::path(token) / command;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && !ec &&
        ::access(candidate.c_str(), X_OK) == 0)
      return candidate.string();
  }
  return "";
}

void renderCounts(const BucketedCounts &series, const PlotOptions &options) {
  if (series.empty())
    throw NoDataError("Nothing to plot: the event series is empty");

  const std::string gnuplot = findExecutableInPath("gnuplot");
  if (gnuplot.empty())
    throw std::runtime_error("gnuplot not found on PATH");

  std::error_code ec;
  const fs::path tmpDir = fs::temp_directory_path(ec);
  if (ec)
    throw std::runtime_error("No temporary directory: " + ec.message());
  ScopedFile script(tmpDir / ("logplot-" + std::to_string(::getpid()) + ".plt"));
  {
    std::ofstream out(script.path());
    if (!out.is_open())
      throw std::runtime_error("Cannot write plot script: " +
                               script.path().string());
    out << buildPlotScript(series, options);
    out.close();
    if (!out)
      throw std::runtime_error("Failed to write plot script: " +
                               script.path().string());
  }

  std::vector<std::string> args{gnuplot};
  if (options.outputPath.empty())
    args.push_back("-persist");
  args.push_back(script.path().string());

  const int rc = spawnAndWait(args);
  if (rc != 0)
    throw std::runtime_error("gnuplot failed with status " +
                             std::to_string(rc));
  if (!options.outputPath.empty() && !fs::exists(options.outputPath, ec))
    throw std::runtime_error("gnuplot produced no image at " +
                             options.outputPath);
}

BucketedCounts plotFileSet(const LogFileSet &set, const PlotOptions &options,
                           ParseReport *report) {
  if (set.empty())
    throw NoDataError("No files match base name '" + set.baseName + "' in " +
                      set.directory.string());

  BucketedCounts series = bucketFileSet(set, options.buckets, report);
  if (series.empty())
    throw NoDataError("Files matching '" + set.baseName +
                      "' yield no events to plot");
  renderCounts(series, options);
  return series;
}
