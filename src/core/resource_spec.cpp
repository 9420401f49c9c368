#include "resource_spec.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <regex>
#include <stdexcept>

int parse_memory_mb(const std::string& mem_str) {
    if (mem_str.empty()) return 0;

    // Find where the numeric part ends; at most one decimal point
    size_t i = 0;
    int dots = 0;
    while (i < mem_str.size() && (std::isdigit(static_cast<unsigned char>(mem_str[i])) ||
                                  mem_str[i] == '.')) {
        if (mem_str[i] == '.' && ++dots > 1) return 0;
        i++;
    }
    if (i == 0) return 0;

    double value = 0;
    try {
        value = std::stod(mem_str.substr(0, i));
    } catch (const std::logic_error&) {
        return 0;  // invalid_argument or out_of_range
    }
    std::string suffix = mem_str.substr(i);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(), ::toupper);

    double mb = 0;
    if (suffix.empty() || suffix == "M" || suffix == "MB") {
        mb = value;
    } else if (suffix == "G" || suffix == "GB") {
        mb = value * 1024;
    } else if (suffix == "T" || suffix == "TB") {
        mb = value * 1024 * 1024;
    } else {
        return 0;  // unknown unit
    }
    if (!(mb < static_cast<double>(std::numeric_limits<int>::max()))) return 0;
    return static_cast<int>(mb);
}

bool is_valid_walltime(const std::string& time) {
    static const std::regex pattern(
        R"(^(\d+-\d{1,2}(:\d{1,2}){0,2}|\d+(:\d{1,2}){0,2})$)");
    return std::regex_match(time, pattern);
}
