#include "File.h"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

static std::optional<fs::path> FindHomeDir() {
    if (const char *home = std::getenv("HOME")) return fs::path{home};
    if (const auto *pw = getpwuid(getuid())) return fs::path{pw->pw_dir};
    return {};
}

fs::path FileIO::ExpandPath(const fs::path &path) {
    if (path.empty() || *path.begin() != "~") return path;

    const auto home_dir = FindHomeDir();
    if (!home_dir) throw std::runtime_error{"Unable to find the home directory."};

    auto expanded = *home_dir;
    for (auto it = std::next(path.begin()); it != path.end(); ++it) expanded /= *it;
    return expanded;
}

std::string FileIO::read(const fs::path &path) {
    const auto full_path = ExpandPath(path);
    std::ifstream in{full_path, std::ios::binary};
    if (!in) throw std::runtime_error{std::format("Unable to open file: {}", full_path.string())};

    // Throws `fs::filesystem_error` for anything that isn't a regular file (e.g. a directory).
    const auto size = fs::file_size(full_path);
    std::string result(size, '\0');
    if (!in.read(result.data(), std::streamsize(size))) throw std::runtime_error{std::format("Unable to read file: {}", full_path.string())};
    return result;
}

bool FileIO::write(const fs::path &path, std::string_view contents) {
    std::ofstream out{ExpandPath(path), std::ios::trunc};
    if (!out) return false;

    out << contents;
    return bool(out);
}
