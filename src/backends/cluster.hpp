#pragma once

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <filesystem>
#include <core/config.hpp>
#include <core/job.hpp>
#include "backend.hpp"
#include "environment.hpp"

// Fill unset JobSpec fields from configured defaults. Default modules are
// loaded before the job's own.
JobSpec apply_job_defaults(const JobSpec& spec, const JobDefaults& defaults);

// The backend selected for this run, plus the configured job defaults.
// Selected once; every build/submit/wait/clean goes through the same backend.
class Cluster {
public:
    explicit Cluster(BackendKind kind, BackendOptions options = BackendOptions(),
                     JobDefaults defaults = JobDefaults());
    explicit Cluster(std::unique_ptr<Backend> backend, JobDefaults defaults = JobDefaults());

    // "auto" in the config runs detect_backend(probe).
    static Cluster from_config(const Config& config, const ToolProbe& probe = ToolProbe());

    BackendKind kind() const { return backend_->kind(); }
    std::string name() const { return backend_->name(); }
    Backend& backend() { return *backend_; }
    const JobDefaults& defaults() const { return defaults_; }

    JobArtifact build(const JobSpec& spec) const;

    JobHandle submit(const JobArtifact& artifact,
                     const std::vector<JobHandle>& dependencies = {});

    // Build then submit, with spec.dependencies.
    JobHandle submit(const JobSpec& spec);

    void wait(const std::vector<JobHandle>& handles);
    void wait(const JobHandle& handle) { wait(std::vector<JobHandle>{handle}); }

    std::set<std::string> clean(const std::filesystem::path& dir = std::filesystem::current_path()) const;

private:
    std::unique_ptr<Backend> backend_;
    JobDefaults defaults_;
};
