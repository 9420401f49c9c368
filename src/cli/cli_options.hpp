#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Parsed `batchq` command line.
struct CliOptions {
    std::string command;                 // detect, script, submit, run, wait, clean
    std::string backend;                 // empty = from config
    int threads = -1;                    // -1 = from config
    std::string config_dir;              // where batchq.yaml is looked up; empty = cwd

    // Job description (script / submit / run)
    std::string name;
    std::string time;
    int cores = 0;                       // 0 = config default, else 1
    std::string memory;
    std::string partition;
    std::string dir;
    std::vector<std::string> modules;
    std::vector<std::string> after;      // dependency job IDs
    std::string job_command;             // after `--`: one word verbatim, or words shell-quoted

    std::vector<std::string> positional; // wait: job IDs, clean: directory

    bool help = false;
    bool version = false;
};

// Parse argv without the program name. Accepts `--opt value` and
// `--opt=value`; everything after a bare `--` is the job command. A single
// word is taken as a shell command line; several words are quoted one by
// one so `-- bash -c "echo a; exit 3"` keeps its argument boundaries.
Result<CliOptions> parse_cli_args(const std::vector<std::string>& args);
