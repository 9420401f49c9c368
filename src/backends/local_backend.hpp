#pragma once

#include <memory>
#include "backend.hpp"
#include "worker_pool.hpp"

// Runs job scripts with bash on an in-process worker pool. The pool is
// created on the first submit and shared by every later submission.
class LocalBackend : public Backend {
public:
    explicit LocalBackend(BackendOptions options = BackendOptions());

    BackendKind kind() const override { return BackendKind::Local; }

    // Non-blocking. Dependencies are awaited inside the worker; if any of
    // them exited non-zero the job is skipped and reports exit code 1.
    JobHandle submit(const JobArtifact& artifact,
                     const std::vector<JobHandle>& dependencies) override;

    void wait(const std::vector<JobHandle>& handles) override;

    // nullptr until the first submit
    const WorkerPool* pool() const { return pool_.get(); }

private:
    WorkerPool& ensure_pool();

    std::unique_ptr<WorkerPool> pool_;
};
