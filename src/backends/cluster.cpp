#include "cluster.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

JobSpec apply_job_defaults(const JobSpec& spec, const JobDefaults& defaults) {
    JobSpec out = spec;
    if (out.partition.empty()) out.partition = defaults.partition;
    if (out.time.empty()) out.time = defaults.time;
    if (out.memory.empty()) out.memory = defaults.memory;
    if (out.cores <= 0 && defaults.cores > 0) out.cores = defaults.cores;
    if (!defaults.modules.empty()) {
        out.modules = defaults.modules;
        out.modules.insert(out.modules.end(), spec.modules.begin(), spec.modules.end());
    }
    return out;
}

Cluster::Cluster(BackendKind kind, BackendOptions options, JobDefaults defaults)
    : backend_(make_backend(kind, std::move(options))), defaults_(std::move(defaults)) {}

Cluster::Cluster(std::unique_ptr<Backend> backend, JobDefaults defaults)
    : backend_(std::move(backend)), defaults_(std::move(defaults)) {
    if (!backend_) throw ConfigError("cluster needs a backend");
}

Cluster Cluster::from_config(const Config& config, const ToolProbe& probe) {
    BackendKind kind = config.backend() == "auto" ? detect_backend(probe)
                                                  : parse_backend_kind(config.backend());
    batchq_log(fmt::format("cluster: using {} backend", backend_name(kind)));
    return Cluster(kind, BackendOptions::from_config(config), config.job_defaults());
}

JobArtifact Cluster::build(const JobSpec& spec) const {
    return backend_->build(apply_job_defaults(spec, defaults_));
}

JobHandle Cluster::submit(const JobArtifact& artifact,
                          const std::vector<JobHandle>& dependencies) {
    return backend_->submit(artifact, dependencies);
}

JobHandle Cluster::submit(const JobSpec& spec) {
    // Check dependencies before writing any files
    require_backend(spec.dependencies, kind(), "dependency");
    return backend_->submit(build(spec), spec.dependencies);
}

void Cluster::wait(const std::vector<JobHandle>& handles) {
    backend_->wait(handles);
}

std::set<std::string> Cluster::clean(const std::filesystem::path& dir) const {
    return backend_->clean(dir);
}
