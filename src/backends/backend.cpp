#include "backend.hpp"
#include "cleaner.hpp"
#include "script_builder.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

using std::chrono::milliseconds;

BackendOptions::BackendOptions()
    : submit_retry{SUBMIT_MAX_ATTEMPTS, milliseconds(SUBMIT_RETRY_DELAY_MS)},
      pbs_poll{milliseconds(PBS_INITIAL_DELAY_MS), milliseconds(POLL_INTERVAL_MS)},
      slurm_poll{milliseconds(SLURM_INITIAL_DELAY_MS), milliseconds(POLL_INTERVAL_MS)} {}

BackendOptions BackendOptions::from_config(const Config& config) {
    BackendOptions o;
    o.threads = config.threads();
    o.submit_retry = {config.submit().max_attempts, milliseconds(config.submit().retry_delay_ms)};
    o.pbs_poll = {milliseconds(config.poll().pbs_initial_delay_ms),
                  milliseconds(config.poll().interval_ms)};
    o.slurm_poll = {milliseconds(config.poll().slurm_initial_delay_ms),
                    milliseconds(config.poll().interval_ms)};
    o.pbs_missing_is_complete = config.poll().pbs_missing_is_complete;
    return o;
}

Backend::Backend(BackendOptions options) : options_(std::move(options)) {
    if (options_.submit_retry.max_attempts < 1) options_.submit_retry.max_attempts = 1;
}

JobArtifact Backend::build(const JobSpec& spec) const {
    return build_job_script(spec, kind());
}

std::set<std::string> Backend::clean(const std::filesystem::path& dir) const {
    return clean_directory(dir, kind());
}

void Backend::check_artifact(const JobArtifact& artifact) const {
    if (artifact.kind != kind()) {
        throw ConfigError(fmt::format(
            "artifact '{}' was built for backend '{}', active backend is '{}'",
            artifact.script, backend_name(artifact.kind), name()));
    }
    if (artifact.script.empty()) {
        throw ConfigError(fmt::format("artifact for job '{}' has no script path", artifact.name));
    }
}

CommandResult Backend::run(const std::string& program,
                           const std::vector<std::string>& args) const {
    if (options_.runner) return options_.runner(program, args);
    return platform::run_command(program, args);
}

void Backend::sleep(milliseconds duration) const {
    if (options_.sleeper) {
        options_.sleeper(duration);
    } else {
        platform::sleep_ms(static_cast<int>(duration.count()));
    }
}

CommandResult Backend::run_with_retry(const std::string& program,
                                      const std::vector<std::string>& args) const {
    const auto& policy = options_.submit_retry;
    CommandResult last{-1, "", ""};

    for (int attempt = 1; attempt <= policy.max_attempts; attempt++) {
        last = run(program, args);
        batchq_log_cmd(fmt::format("{}:submit[{}]", name(), attempt), program, args, last);
        if (last.success()) return last;

        if (attempt < policy.max_attempts) {
            sleep(policy.delay);
        }
    }

    std::string output = last.get_output();
    trim(output);
    throw SubmissionError(fmt::format(
        "{}: '{} {}' failed {} times (exit {}): {}",
        name(), program, join(args, " "), policy.max_attempts, last.exit_code, output));
}
