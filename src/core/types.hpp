#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>

// Result type for operations that can fail without throwing
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of running an external tool (sbatch, qstat, ...)
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Which execution backend a cluster session drives.
enum class BackendKind {
    Local,
    PBS,
    Slurm,
};

// Canonical lowercase name ("local", "pbs", "slurm"). Out-of-range values
// render as "unknown(<n>)" so they can be reported.
std::string backend_name(BackendKind kind);

// Parse a backend name or alias (normal, torque, pbs-style, slurm-style, ...).
// Throws ConfigError on anything unrecognized. "auto" is not accepted here.
BackendKind parse_backend_kind(const std::string& text);

// Runs an external program with argv (no shell) and captures its output.
using CommandRunner = std::function<CommandResult(const std::string& program,
                                                  const std::vector<std::string>& args)>;

// Blocks the caller; injectable so tests don't actually sleep.
using Sleeper = std::function<void(std::chrono::milliseconds)>;
