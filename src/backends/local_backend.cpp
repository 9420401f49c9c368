#include "local_backend.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fstream>

namespace {

struct Dependency {
    std::string name;
    std::shared_future<int> result;
};

// Returns the job's exit code. Runs on a pool worker.
int run_local_job(const JobArtifact& artifact, const std::vector<Dependency>& deps) {
    for (const auto& dep : deps) {
        int code = dep.result.get();
        if (code != 0) {
            // Nothing from an earlier run may survive in the outputs
            std::ofstream out(artifact.stdout_path, std::ios::trunc);
            std::ofstream err(artifact.stderr_path, std::ios::trunc);
            err << fmt::format("Dependency {} exited with code {}, not running {}\n",
                               dep.name, code, artifact.name);
            batchq_log(fmt::format("local: skipping '{}', dependency '{}' exited {}",
                                   artifact.name, dep.name, code));
            return 1;
        }
    }

    batchq_log(fmt::format("local: starting '{}'", artifact.name));
    auto proc = platform::spawn(SHELL_BIN, {artifact.script},
                                artifact.stdout_path, artifact.stderr_path);
    if (!proc.valid()) {
        batchq_log(fmt::format("local: could not fork for '{}'", artifact.name));
        return -1;
    }
    int code = proc.wait();
    batchq_log(fmt::format("local: '{}' finished (exit {})", artifact.name, code));
    return code;
}

} // namespace

LocalBackend::LocalBackend(BackendOptions options) : Backend(std::move(options)) {}

WorkerPool& LocalBackend::ensure_pool() {
    if (!pool_) {
        int workers = options_.threads > 0 ? options_.threads : platform::cpu_count();
        pool_ = std::make_unique<WorkerPool>(workers);
    }
    return *pool_;
}

JobHandle LocalBackend::submit(const JobArtifact& artifact,
                               const std::vector<JobHandle>& dependencies) {
    check_artifact(artifact);
    require_backend(dependencies, kind(), "dependency");

    std::vector<Dependency> deps;
    deps.reserve(dependencies.size());
    for (const auto& h : dependencies) {
        deps.push_back({h.id(), h.result()});
    }

    auto result = ensure_pool().submit([artifact, deps]() {
        return run_local_job(artifact, deps);
    });

    batchq_log(fmt::format("local: queued '{}' ({} dependencies)", artifact.name, deps.size()));
    return JobHandle::local(artifact.name, result);
}

void LocalBackend::wait(const std::vector<JobHandle>& handles) {
    require_backend(handles, kind(), "job");
    for (const auto& h : handles) {
        h.result().wait();
    }
}
