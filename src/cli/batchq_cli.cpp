#include "batchq_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

// Defined in commands/*.cpp
void register_job_commands(BatchqCLI& cli);
void register_environment_commands(BatchqCLI& cli);

BatchqCLI::BatchqCLI() {
    register_job_commands(*this);
    register_environment_commands(*this);
}

void BatchqCLI::add_command(const std::string& name, CommandHandler handler,
                            const std::string& help) {
    commands_[name] = {std::move(handler), help};
}

bool BatchqCLI::load_config(const CliOptions& opts) {
    auto result = opts.config_dir.empty() ? Config::load() : Config::load(opts.config_dir);
    if (result.is_err()) {
        std::cerr << theme::fail(result.error);
        return false;
    }
    Config cfg = result.value;

    if (!opts.backend.empty()) {
        auto r = cfg.set_backend(opts.backend);
        if (r.is_err()) {
            std::cerr << theme::fail(r.error);
            return false;
        }
    }
    if (opts.threads >= 0) cfg.set_threads(opts.threads);

    set_batchq_log_path(cfg.log_file());
    config_ = cfg;
    return true;
}

Cluster& BatchqCLI::cluster() {
    if (!cluster_) {
        cluster_.emplace(Cluster::from_config(config_.value()));
    }
    return *cluster_;
}

JobSpec BatchqCLI::job_spec_from(const CliOptions& opts) const {
    JobSpec spec;
    spec.command = opts.job_command;
    spec.name = opts.name;
    spec.time = opts.time;
    spec.cores = opts.cores;
    spec.memory = opts.memory;
    spec.partition = opts.partition;
    spec.modules = opts.modules;
    spec.dir = opts.dir;
    return spec;
}

int BatchqCLI::execute(const CliOptions& opts) {
    auto it = commands_.find(opts.command);
    if (it == commands_.end()) {
        std::cerr << theme::fail("Unknown command: " + opts.command);
        print_usage();
        return 1;
    }

    if (!load_config(opts)) return 1;

    batchq_log(fmt::format("cli: {}", opts.command));
    return it->second.first(*this, opts);
}

void BatchqCLI::print_usage() const {
    std::cerr << theme::section("Usage");
    std::cerr << theme::usage("batchq <command> [options] [-- command]", "");
    std::cerr << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        std::cerr << theme::usage(name, entry.second);
    }
    std::cerr << theme::section("Options");
    std::cerr << theme::usage("-b, --backend <auto|local|pbs|slurm>", "Override the configured backend");
    std::cerr << theme::usage("-n, --name <name>", "Job name (required to build/submit)");
    std::cerr << theme::usage("-t, --time <HH:MM:SS>", "Walltime");
    std::cerr << theme::usage("-c, --cores <n>", "Cores for the job");
    std::cerr << theme::usage("-m, --mem <size>", "Memory, MB or with M/G/T suffix");
    std::cerr << theme::usage("-p, --partition <name>", "Partition / queue");
    std::cerr << theme::usage("-d, --dir <path>", "Working and job file directory");
    std::cerr << theme::usage("--module <name>", "Environment module to load (repeatable)");
    std::cerr << theme::usage("--after <id>[,<id>]", "Run only after these jobs succeed");
    std::cerr << theme::usage("--threads <n>", "Local worker count (0 = all cores)");
    std::cerr << theme::usage("--config-dir <path>", "Directory holding batchq.yaml");
    std::cerr << "\n";
    std::cerr << theme::usage("batchq --version", "Show version");
    std::cerr << theme::usage("batchq --help", "Show this help");
    std::cerr << "\n";
}
