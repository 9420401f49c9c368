#pragma once

#include <string>

// Parse a memory string like "128G", "4096M", "4G", "4096" to megabytes.
// A bare number is megabytes. Returns 0 on parse failure or when the
// result doesn't fit in an int.
int parse_memory_mb(const std::string& mem_str);

// True for walltimes the schedulers accept: "MM", "MM:SS", "HH:MM:SS",
// "D-HH", "D-HH:MM", "D-HH:MM:SS".
bool is_valid_walltime(const std::string& time);

// Core request as rendered into directives: anything below 1 becomes 1.
inline int effective_cores(int cores) { return cores > 0 ? cores : 1; }
