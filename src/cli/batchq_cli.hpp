#pragma once

#include <string>
#include <map>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <backends/cluster.hpp>
#include "cli_options.hpp"

class BatchqCLI {
public:
    BatchqCLI();

    // Returns the process exit code.
    using CommandHandler = std::function<int(BatchqCLI&, const CliOptions&)>;

    void add_command(const std::string& name, CommandHandler handler, const std::string& help);

    // Load config, apply --backend/--threads, then dispatch.
    int execute(const CliOptions& opts);

    void print_usage() const;

    // Lazily built from the loaded config on first use.
    Cluster& cluster();
    JobSpec job_spec_from(const CliOptions& opts) const;

private:
    bool load_config(const CliOptions& opts);

    std::optional<Config> config_;
    std::optional<Cluster> cluster_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
