#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Resolve an executable name against PATH, like `which`. Names containing a
// slash are checked as-is.
std::optional<std::filesystem::path> which(const std::string& program);

// Number of hardware threads, at least 1.
int cpu_count();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
