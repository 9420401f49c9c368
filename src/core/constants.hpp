#pragma once

// ── File naming ─────────────────────────────────────────────
// Every file we create starts with "<name>.cluster" so clean() can never
// match anything a user wrote by hand.
constexpr const char* CLUSTER_SUFFIX     = ".cluster";
constexpr const char* STDOUT_SUFFIX      = ".cluster.out";
constexpr const char* STDERR_SUFFIX      = ".cluster.err";
constexpr const char* QSUB_SUFFIX        = ".cluster.qsub";
constexpr const char* SBATCH_SUFFIX      = ".cluster.sbatch";
constexpr const char* SLURM_SCRIPT_SUFFIX = ".cluster.script";

// ── Scheduler tools ─────────────────────────────────────────
constexpr const char* SBATCH_BIN = "sbatch";
constexpr const char* SQUEUE_BIN = "squeue";
constexpr const char* QSUB_BIN   = "qsub";
constexpr const char* QSTAT_BIN  = "qstat";
constexpr const char* SHELL_BIN  = "bash";

// ── Submission retry ────────────────────────────────────────
constexpr int SUBMIT_MAX_ATTEMPTS     = 5;     // Total invocations of sbatch/qsub
constexpr int SUBMIT_RETRY_DELAY_MS   = 1000;  // Pause between attempts

// ── Polling ─────────────────────────────────────────────────
constexpr int PBS_INITIAL_DELAY_MS    = 5000;  // torque enqueues asynchronously
constexpr int SLURM_INITIAL_DELAY_MS  = 2000;
constexpr int POLL_INTERVAL_MS        = 2000;

// ── qstat -a table layout ───────────────────────────────────
constexpr int QSTAT_HEADER_LINE       = 3;
constexpr int QSTAT_FIRST_DATA_LINE   = 5;
constexpr int QSTAT_STATE_FIELD       = 9;

// ── Output truncation in the debug log ──────────────────────
constexpr int LOG_OUTPUT_MAX_CHARS    = 500;
