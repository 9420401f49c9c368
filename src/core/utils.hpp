#pragma once

#include <string>
#include <vector>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string s);

// Split on a single delimiter, keeping empty fields.
std::vector<std::string> split(const std::string& s, char delimiter);

// Split on runs of at least `min_run` spaces/tabs. Leading and trailing
// whitespace never produces empty fields.
std::vector<std::string> split_spaces(const std::string& s, std::size_t min_run = 1);

// Split text into lines, dropping a trailing '\r' on each.
std::vector<std::string> split_lines(const std::string& s);

// Join with a separator: join({"a","b"}, ":") == "a:b".
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Quote one word for bash. Words made only of [A-Za-z0-9_./:@%+=,-] come
// back unchanged; anything else is single-quoted with ' written as '\''.
std::string shell_quote(const std::string& word);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);
