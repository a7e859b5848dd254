#pragma once

#include <string>
#include <string_view>

#include "Helper/Path.h"

namespace FileIO {
// Replace a leading `~` with the user's home directory.
fs::path ExpandPath(const fs::path &);

// Throws `std::runtime_error` if the file can't be read.
std::string read(const fs::path &path);
bool write(const fs::path &path, std::string_view contents);
} // namespace FileIO
