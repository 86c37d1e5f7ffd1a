#include "LogFileSet.h"

// Directory scan for per-worker log files. Matching is a plain prefix test on
// the file name; the suffix after the base name is opaque.

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "LogErrors.h"

namespace fs = std::filesystem;

namespace {

bool startsWith(const std::string &str, const std::string &prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

LogFileSet resolveLogFileSet(const std::string &baseName,
                             const fs::path &directory) {
  if (baseName.empty())
    throw std::invalid_argument("Base name must not be empty");

  LogFileSet set;
  set.baseName = baseName;
  set.directory = directory;

  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec)
    throw NotFoundError("Cannot read directory '" + directory.string() +
                        "': " + ec.message());

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const fs::directory_entry &entry = *it;
    if (!startsWith(entry.path().filename().string(), baseName))
      continue;

    // Entries may disappear between listing and stat; those are not members.
    std::error_code statEc;
    if (!entry.is_regular_file(statEc) || statEc)
      continue;
    set.files.push_back(entry.path());
  }
  if (ec)
    throw NotFoundError("Error while scanning '" + directory.string() +
                        "': " + ec.message());

  std::sort(set.files.begin(), set.files.end());
  return set;
}

std::size_t excludePath(LogFileSet &set, const fs::path &path) {
  const auto before = set.files.size();
  set.files.erase(std::remove_if(set.files.begin(), set.files.end(),
                                 [&](const fs::path &member) {
                                   std::error_code ec;
                                   return fs::equivalent(member, path, ec) &&
                                          !ec;
                                 }),
                  set.files.end());
  return before - set.files.size();
}
