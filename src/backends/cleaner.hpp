#pragma once

#include <string>
#include <vector>
#include <set>
#include <filesystem>
#include <core/types.hpp>

// Suffixes of every file `kind` may create: the shared .cluster.out /
// .cluster.err plus the backend's own script suffixes.
std::vector<std::string> cleanup_suffixes(BackendKind kind);

// Delete regular files directly inside `dir` whose names end in one of
// cleanup_suffixes(kind). Subdirectories are never entered. Returns the
// deleted file names. Throws ConfigError if `dir` is not a directory.
std::set<std::string> clean_directory(const std::filesystem::path& dir, BackendKind kind);
