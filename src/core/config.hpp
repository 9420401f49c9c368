#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Defaults merged into a JobSpec wherever the caller left a field unset.
struct JobDefaults {
    std::string partition;
    std::string time;
    int cores = 0;                      // 0 = not configured
    std::string memory;
    std::vector<std::string> modules;   // prepended to the job's own modules
};

struct SubmitSettings {
    int max_attempts;
    int retry_delay_ms;
};

struct PollSettings {
    int interval_ms;
    int pbs_initial_delay_ms;
    int slurm_initial_delay_ms;
    bool pbs_missing_is_complete;       // treat jobs gone from qstat as done
};

class Config {
public:
    Config();

    // Load global config from ~/.batchq/config.yaml (missing file = defaults)
    static Result<Config> load_global();

    // Load project config from <dir>/batchq.yaml (missing file = defaults)
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Global, then project keys on top
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse YAML text on top of the defaults
    static Result<Config> parse(const std::string& yaml_text);

    // "auto", "local", "pbs" or "slurm" (aliases are normalized on load)
    const std::string& backend() const { return backend_; }
    int threads() const { return threads_; }
    const std::string& log_file() const { return log_file_; }
    const JobDefaults& job_defaults() const { return job_; }
    const SubmitSettings& submit() const { return submit_; }
    const PollSettings& poll() const { return poll_; }

    // Command-line overrides. set_backend validates like the YAML key does.
    Result<void> set_backend(const std::string& value);
    void set_threads(int threads) { threads_ = threads; }

private:
    std::string backend_ = "auto";
    int threads_ = 0;                   // 0 = one worker per hardware thread
    std::string log_file_;
    JobDefaults job_;
    SubmitSettings submit_;
    PollSettings poll_;

    friend class ConfigLoader;
};

// Helper to check if configs exist
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
