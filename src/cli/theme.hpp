#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// ANSI colors for status lines on stderr, suppressed when stderr isn't a
// terminal. Data (job IDs, paths) goes to stdout uncolored.
namespace color {
    inline bool enabled() {
        static const bool tty = isatty(STDERR_FILENO) != 0;
        return tty;
    }
    inline std::string code(const char* seq) { return enabled() ? seq : ""; }

    inline std::string BLUE()   { return code("\033[34m"); }
    inline std::string RED()    { return code("\033[91m"); }
    inline std::string GREEN()  { return code("\033[92m"); }
    inline std::string YELLOW() { return code("\033[93m"); }
    inline std::string BOLD()   { return code("\033[1m"); }
    inline std::string DIM()    { return code("\033[2m"); }
    inline std::string RESET()  { return code("\033[0m"); }
}

inline std::string dim(const std::string& s)  { return color::DIM() + s + color::RESET(); }

inline std::string section(const std::string& title) {
    return "\n" + color::BOLD() + "  " + title + color::RESET() + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN() + "    + " + color::RESET() + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED() + "    x " + color::RESET() + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE() + "    ~ " + color::RESET() + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW() + "    ! " + color::RESET() + msg + "\n";
}

// Usage row: command column padded, description dimmed
inline std::string usage(const std::string& cmd, const std::string& desc) {
    return fmt::format("    {:<34}", cmd) + dim(desc) + "\n";
}

} // namespace theme
