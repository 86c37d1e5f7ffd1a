#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

/// @file
/// Discovery of per-worker log files. Workers append to
/// `<baseName><unique suffix>` files, so one logical log is the set of files
/// in a directory whose name starts with the base name.

/// A base name together with the files it resolved to.
struct LogFileSet {
    std::string baseName;
    std::filesystem::path directory;
    /// Regular files whose file name starts with `baseName`, sorted by name.
    std::vector<std::filesystem::path> files;

    bool empty() const { return files.empty(); }
    std::size_t size() const { return files.size(); }
};

/// Scans `directory` (not recursively) for regular files whose name begins
/// with `baseName`. An empty result is not an error here; callers decide.
/// @throws std::invalid_argument if `baseName` is empty.
/// @throws NotFoundError if `directory` is missing or unreadable.
LogFileSet resolveLogFileSet(const std::string &baseName,
                             const std::filesystem::path &directory = ".");

/// Removes every member equivalent to `path` (e.g. a tool's own output file
/// sharing the base name). Returns the number of files removed.
std::size_t excludePath(LogFileSet &set, const std::filesystem::path &path);
