#include "platform.hpp"
#include <core/utils.hpp>
#include <cstdlib>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

static bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<fs::path> which(const std::string& program) {
    if (program.empty()) return std::nullopt;
    if (program.find('/') != std::string::npos) {
        if (is_executable(program)) return fs::path(program);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    for (const auto& dir : split(path_env, ':')) {
        // An empty PATH entry means the current directory
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / program;
        if (is_executable(candidate)) return candidate;
    }
    return std::nullopt;
}

int cpu_count() {
    unsigned n = std::thread::hardware_concurrency();
    return n > 0 ? static_cast<int>(n) : 1;
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
