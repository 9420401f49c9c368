#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::vector<std::string> split_spaces(const std::string& s, std::size_t min_run) {
    if (min_run == 0) min_run = 1;
    std::vector<std::string> out;
    std::string field;
    std::size_t i = 0;
    while (i < s.size()) {
        if (s[i] == ' ' || s[i] == '\t') {
            std::size_t j = i;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t')) j++;
            if (j - i >= min_run) {
                if (!field.empty()) out.push_back(field);
                field.clear();
            } else if (!field.empty() && j < s.size()) {
                // A short gap is part of the field ("Job ID")
                field.append(s, i, j - i);
            }
            i = j;
        } else {
            field += s[i++];
        }
    }
    if (!field.empty()) out.push_back(field);
    return out;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines = split(s, '\n');
    for (auto& l : lines) {
        if (!l.empty() && l.back() == '\r') l.pop_back();
    }
    return lines;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); i++) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string shell_quote(const std::string& word) {
    static const std::string safe =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_./:@%+=,-";
    if (!word.empty() && word.find_first_not_of(safe) == std::string::npos) return word;

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::logic_error&) {
        return fallback;
    }
}
