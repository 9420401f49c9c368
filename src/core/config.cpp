#include "config.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "resource_spec.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".batchq";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "batchq.yaml";
}

Config::Config()
    : submit_{SUBMIT_MAX_ATTEMPTS, SUBMIT_RETRY_DELAY_MS},
      poll_{POLL_INTERVAL_MS, PBS_INITIAL_DELAY_MS, SLURM_INITIAL_DELAY_MS, false} {}

static Result<std::string> normalize_backend(const std::string& value) {
    if (value == "auto") return Result<std::string>::Ok(value);
    try {
        return Result<std::string>::Ok(backend_name(parse_backend_kind(value)));
    } catch (const ConfigError& e) {
        return Result<std::string>::Err(e.what());
    }
}

Result<void> Config::set_backend(const std::string& value) {
    auto r = normalize_backend(value);
    if (r.is_err()) return Result<void>::Err(r.error);
    backend_ = r.value;
    return Result<void>::Ok();
}

// Applies only the keys present in `root`, so a project file can override
// a single global setting without restating the rest.
class ConfigLoader {
public:
    static Result<void> overlay(const YAML::Node& root, Config& cfg) {
        if (!root || root.IsNull()) return Result<void>::Ok();
        if (!root.IsMap()) return Result<void>::Err("top level must be a mapping");

        if (root["backend"]) {
            auto r = cfg.set_backend(root["backend"].as<std::string>());
            if (r.is_err()) return r;
        }
        if (root["threads"]) {
            cfg.threads_ = root["threads"].as<int>(0);
            if (cfg.threads_ < 0) {
                return Result<void>::Err(fmt::format("threads must be >= 0, got {}", cfg.threads_));
            }
        }
        if (root["log_file"]) cfg.log_file_ = root["log_file"].as<std::string>("");

        const YAML::Node job = root["job"];
        if (job && job.IsMap()) {
            auto r = overlay_job(job, cfg.job_);
            if (r.is_err()) return r;
        }

        const YAML::Node submit = root["submit"];
        if (submit && submit.IsMap()) {
            if (submit["max_attempts"]) {
                cfg.submit_.max_attempts = submit["max_attempts"].as<int>(SUBMIT_MAX_ATTEMPTS);
                if (cfg.submit_.max_attempts < 1) {
                    return Result<void>::Err("submit.max_attempts must be at least 1");
                }
            }
            if (submit["retry_delay_ms"])
                cfg.submit_.retry_delay_ms = submit["retry_delay_ms"].as<int>(SUBMIT_RETRY_DELAY_MS);
        }

        const YAML::Node poll = root["poll"];
        if (poll && poll.IsMap()) {
            if (poll["interval_ms"])
                cfg.poll_.interval_ms = poll["interval_ms"].as<int>(POLL_INTERVAL_MS);
            if (poll["pbs_initial_delay_ms"])
                cfg.poll_.pbs_initial_delay_ms = poll["pbs_initial_delay_ms"].as<int>(PBS_INITIAL_DELAY_MS);
            if (poll["slurm_initial_delay_ms"])
                cfg.poll_.slurm_initial_delay_ms = poll["slurm_initial_delay_ms"].as<int>(SLURM_INITIAL_DELAY_MS);
            if (poll["pbs_missing_is_complete"])
                cfg.poll_.pbs_missing_is_complete = poll["pbs_missing_is_complete"].as<bool>(false);
        }

        return Result<void>::Ok();
    }

private:
    static Result<void> overlay_job(const YAML::Node& node, JobDefaults& job) {
        if (node["partition"]) job.partition = node["partition"].as<std::string>("");
        if (node["time"]) {
            job.time = node["time"].as<std::string>("");
            if (!job.time.empty() && !is_valid_walltime(job.time)) {
                return Result<void>::Err(fmt::format("job.time '{}' is not a walltime", job.time));
            }
        }
        if (node["cores"]) job.cores = node["cores"].as<int>(0);
        if (node["memory"]) {
            job.memory = node["memory"].as<std::string>("");
            if (!job.memory.empty() && parse_memory_mb(job.memory) <= 0) {
                return Result<void>::Err(fmt::format("job.memory '{}' is not a memory size", job.memory));
            }
        }
        if (node["modules"]) {
            // Single string or list, like `module load` accepts
            job.modules.clear();
            if (node["modules"].IsScalar()) {
                job.modules.push_back(node["modules"].as<std::string>());
            } else if (node["modules"].IsSequence()) {
                for (const auto& m : node["modules"]) {
                    job.modules.push_back(m.as<std::string>());
                }
            }
        }
        return Result<void>::Ok();
    }
};

static Result<Config> load_file_onto(const fs::path& path, Config cfg) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(cfg);
    }
    try {
        auto r = ConfigLoader::overlay(YAML::LoadFile(path.string()), cfg);
        if (r.is_err()) {
            return Result<Config>::Err(fmt::format("{}: {}", path.string(), r.error));
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
    return Result<Config>::Ok(cfg);
}

Result<Config> Config::load_global() {
    return load_file_onto(get_global_config_path(), Config{});
}

Result<Config> Config::load_project(const fs::path& dir) {
    return load_file_onto(get_project_config_path(dir), Config{});
}

Result<Config> Config::load(const fs::path& project_dir) {
    auto global = load_global();
    if (global.is_err()) return global;
    return load_file_onto(get_project_config_path(project_dir), global.value);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config cfg;
    try {
        auto r = ConfigLoader::overlay(YAML::Load(yaml_text), cfg);
        if (r.is_err()) return Result<Config>::Err(r.error);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config: {}", e.what()));
    }
    return Result<Config>::Ok(cfg);
}
