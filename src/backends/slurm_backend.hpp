#pragma once

#include <map>
#include "backend.hpp"

// Slurm through sbatch and squeue.
class SlurmBackend : public Backend {
public:
    explicit SlurmBackend(BackendOptions options = BackendOptions());

    BackendKind kind() const override { return BackendKind::Slurm; }

    // sbatch [--dependency=afterok:<id>[:<id>...]] <script>
    JobHandle submit(const JobArtifact& artifact,
                     const std::vector<JobHandle>& dependencies) override;

    // squeue only lists live jobs, so a job that's gone is finished, as are
    // jobs in CD (completed) or F (failed).
    void wait(const std::vector<JobHandle>& handles) override;
};

// "Submitted batch job 1234" -> "1234". Throws SubmissionError when the last
// whitespace-delimited token isn't numeric.
std::string parse_sbatch_job_id(const std::string& output);

// Parse `squeue -h -o %A,%t` lines into job ID -> compact state.
std::map<std::string, std::string> parse_squeue_states(const std::string& output);
