#pragma once

#include <string>
#include <vector>
#include <future>
#include "types.hpp"

// Identifies one submitted job. Scheduler backends hand out numeric IDs;
// the local backend hands out a future of the job's exit code. The backend
// tag travels with the handle so wait() can refuse handles from another
// backend instead of misinterpreting them.
class JobHandle {
public:
    // PBS/Slurm job. Throws ConfigError unless job_id is all digits and kind
    // is a scheduler backend.
    static JobHandle scheduler(BackendKind kind, const std::string& job_id);

    // Local worker-pool job.
    static JobHandle local(const std::string& name, std::shared_future<int> result);

    // Handle from user text (CLI, config). PBS IDs may carry a ".server"
    // suffix which is dropped. Throws ConfigError for Local or non-numeric text.
    static JobHandle parse(BackendKind kind, const std::string& text);

    BackendKind kind() const { return kind_; }
    bool is_local() const { return kind_ == BackendKind::Local; }

    // Scheduler job ID, or the job name for local handles.
    const std::string& id() const { return id_; }

    // Only meaningful for local handles.
    const std::shared_future<int>& result() const { return result_; }

private:
    JobHandle() = default;

    BackendKind kind_ = BackendKind::Local;
    std::string id_;
    std::shared_future<int> result_;
};

// Throws ConfigError naming the first handle whose backend is not `kind`.
// `what` describes the caller's use ("dependency", "wait").
void require_backend(const std::vector<JobHandle>& handles, BackendKind kind,
                     const std::string& what);

// What the caller wants run. Only command and name are required.
struct JobSpec {
    std::string command;
    std::string name;                    // every file name derives from this
    std::string time;                    // walltime, e.g. "04:00:00"; empty = scheduler default
    int cores = 1;                       // <= 0 is treated as 1
    std::string memory;                  // "4096", "4G", ...; empty = scheduler default
    std::string partition;               // queue on PBS, partition on Slurm
    std::vector<std::string> modules;    // `module load` before the job body (HPC only)
    std::string dir;                     // working + artifact directory; empty = cwd
    std::vector<JobHandle> dependencies; // honoured by Cluster::submit(const JobSpec&)
};

// Rendered job files on disk, produced by build_job_script().
struct JobArtifact {
    BackendKind kind = BackendKind::Local;
    std::string name;
    std::string dir;           // absolute
    std::string script;        // absolute path of the file handed to the submitter
    std::string companion;     // Slurm only: the .cluster.script launched by srun
    std::string stdout_path;
    std::string stderr_path;
};
