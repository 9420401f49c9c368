#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <filesystem>
#include <core/types.hpp>
#include <core/job.hpp>

class Config;

// Bounded retry for submission tools: max_attempts invocations in total,
// `delay` between consecutive attempts.
struct RetryPolicy {
    int max_attempts;
    std::chrono::milliseconds delay;
};

// Scheduler status polling: wait `initial_delay` before the first query,
// then `interval` between queries.
struct PollPolicy {
    std::chrono::milliseconds initial_delay;
    std::chrono::milliseconds interval;
};

struct BackendOptions {
    BackendOptions();

    int threads = 0;                    // local worker count; 0 = hardware threads
    RetryPolicy submit_retry;
    PollPolicy pbs_poll;
    PollPolicy slurm_poll;
    bool pbs_missing_is_complete = false;
    CommandRunner runner;               // empty = platform::run_command
    Sleeper sleeper;                    // empty = real sleep

    static BackendOptions from_config(const Config& config);
};

// One execution backend. A Cluster holds exactly one for its lifetime;
// every operation checks that artifacts and handles came from the same kind.
class Backend {
public:
    virtual ~Backend() = default;

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    virtual BackendKind kind() const = 0;
    std::string name() const { return backend_name(kind()); }

    // Render the job files for this backend (see build_job_script).
    JobArtifact build(const JobSpec& spec) const;

    // Hand a built artifact to the backend. Dependencies must be handles of
    // this backend; the job only runs once all of them succeeded.
    virtual JobHandle submit(const JobArtifact& artifact,
                             const std::vector<JobHandle>& dependencies) = 0;

    // Block until every handle reached a terminal state.
    virtual void wait(const std::vector<JobHandle>& handles) = 0;

    // Delete this backend's artifacts and outputs directly inside `dir`.
    std::set<std::string> clean(const std::filesystem::path& dir) const;

protected:
    explicit Backend(BackendOptions options);

    // Throws ConfigError if the artifact was built for another backend.
    void check_artifact(const JobArtifact& artifact) const;

    CommandResult run(const std::string& program, const std::vector<std::string>& args) const;
    void sleep(std::chrono::milliseconds duration) const;

    // Run a submission tool under the retry policy. Returns the first
    // successful result; throws SubmissionError once every attempt failed.
    CommandResult run_with_retry(const std::string& program,
                                 const std::vector<std::string>& args) const;

    BackendOptions options_;
};
