#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <unistd.h>

/// @file
/// Fixture helpers for the test executables: a temporary directory removed
/// on scope exit, and a one-call file writer.

class ScopedTempDir {
public:
    ScopedTempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("lograte-test-" + std::to_string(::getpid()) + "-" +
                 std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &operator=(const ScopedTempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    /// Creates (or replaces) `name` inside the directory with `content`.
    std::filesystem::path write(const std::string &name,
                                const std::string &content) const {
        const auto file = path_ / name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        if (!out)
            throw std::runtime_error("cannot create fixture " + file.string());
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

inline std::string readWholeFile(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}
