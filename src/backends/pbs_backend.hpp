#pragma once

#include <map>
#include "backend.hpp"

// Torque/PBS through qsub and `qstat -a`.
class PBSBackend : public Backend {
public:
    explicit PBSBackend(BackendOptions options = BackendOptions());

    BackendKind kind() const override { return BackendKind::PBS; }

    // qsub [-W depend=afterok:<id>[,afterok:<id>...]] <script>
    JobHandle submit(const JobArtifact& artifact,
                     const std::vector<JobHandle>& dependencies) override;

    // Only an explicit "C" state finishes a job. Jobs missing from qstat
    // stay outstanding unless pbs_missing_is_complete is set.
    void wait(const std::vector<JobHandle>& handles) override;
};

// "1234.server.domain\n" -> "1234". Throws SubmissionError when the first
// dot-delimited token isn't numeric.
std::string parse_qsub_job_id(const std::string& output);

// Parse `qstat -a` output into job ID (server suffix dropped) -> state
// letter. Empty output is an empty table. Throws ConfigError if the header
// doesn't have the state column where we expect it.
std::map<std::string, std::string> parse_qstat_table(const std::string& output);
