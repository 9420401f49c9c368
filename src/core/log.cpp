#include "log.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

static std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "batchq_debug.log").string();
    return path;
}

std::string batchq_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_batchq_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void batchq_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << line;
}

void batchq_log_cmd(const std::string& label, const std::string& program,
                    const std::vector<std::string>& args, const CommandResult& r) {
    std::string cmdline = program;
    if (!args.empty()) cmdline += " " + join(args, " ");
    batchq_log(fmt::format("{} CMD: {}", label, cmdline));
    batchq_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                           r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_MAX_CHARS)));
    if (!r.stderr_data.empty())
        batchq_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_MAX_CHARS)));
}
