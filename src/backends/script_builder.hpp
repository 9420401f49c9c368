#pragma once

#include <string>
#include <vector>
#include <core/job.hpp>

// Render and write the job files for `kind`:
//   Local  <name>.cluster           run directly by bash
//   PBS    <name>.cluster.qsub      #PBS directives + job body
//   Slurm  <name>.cluster.sbatch    #SBATCH directives, srun's the companion
//          <name>.cluster.script    job body
// The directory is created if needed and existing files are overwritten.
// Throws ConfigError for an unknown kind or an invalid spec, and for a
// PBS/Slurm directory that would need quoting in a directive.
JobArtifact build_job_script(const JobSpec& spec, BackendKind kind);

// Throws ConfigError for a missing name or one with characters outside
// [A-Za-z0-9._+-], empty command, bad memory
// or walltime.
void validate_job_spec(const JobSpec& spec);

// Absolute, normalized form of spec.dir (cwd when empty).
std::string resolve_job_dir(const JobSpec& spec);

// ── Script fragments ────────────────────────────────────────
// Exposed so the exact layout can be tested without touching disk.

// cd into the job dir, print a timestamp, announce the job.
std::string render_preamble(const std::string& dir, const std::string& name);

// Capture the exit code, print a timestamp, report failures on stderr and
// propagate the exit code.
std::string render_postamble();

// One `module load` line per module.
std::string render_module_loads(const std::vector<std::string>& modules);

std::string render_local_script(const JobSpec& spec, const std::string& dir);
std::string render_qsub_script(const JobSpec& spec, const std::string& dir);
std::string render_sbatch_script(const JobSpec& spec, const std::string& dir);
std::string render_slurm_body(const JobSpec& spec, const std::string& dir);
