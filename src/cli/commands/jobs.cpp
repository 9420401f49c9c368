#include "../batchq_cli.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <iostream>
#include <fmt/format.h>

// ── Helpers ──────────────────────────────────────────────────

static std::vector<JobHandle> dependencies_from(BatchqCLI& cli, const CliOptions& opts) {
    std::vector<JobHandle> deps;
    for (const auto& id : opts.after) {
        deps.push_back(JobHandle::parse(cli.cluster().kind(), id));
    }
    return deps;
}

static bool require_job(const CliOptions& opts) {
    if (opts.name.empty()) {
        std::cerr << theme::fail("Missing job name.");
        std::cerr << theme::info("Usage: batchq <script|submit|run> -n <name> [options] -- <command>");
        return false;
    }
    if (opts.job_command.empty()) {
        std::cerr << theme::fail("Missing command after '--'.");
        return false;
    }
    return true;
}

// Local jobs live in this process's worker pool; report and return the
// job's exit code.
static int finish_local(const JobHandle& handle, const JobArtifact& artifact) {
    int code = handle.result().get();
    if (code == 0) {
        std::cerr << theme::ok(fmt::format("Job '{}' finished", artifact.name));
    } else {
        std::cerr << theme::fail(fmt::format("Job '{}' exited with code {} (see {})",
                                             artifact.name, code, artifact.stderr_path));
    }
    return code;
}

// ── Commands ─────────────────────────────────────────────────

static int do_script(BatchqCLI& cli, const CliOptions& opts) {
    if (!require_job(opts)) return 1;
    auto artifact = cli.cluster().build(cli.job_spec_from(opts));
    std::cout << artifact.script << "\n";
    if (!artifact.companion.empty()) std::cout << artifact.companion << "\n";
    return 0;
}

static int submit_job(BatchqCLI& cli, const CliOptions& opts, bool wait) {
    if (!require_job(opts)) return 1;
    auto& cluster = cli.cluster();

    auto deps = dependencies_from(cli, opts);
    auto artifact = cluster.build(cli.job_spec_from(opts));
    auto handle = cluster.submit(artifact, deps);

    if (handle.is_local()) {
        std::cerr << theme::info(fmt::format("Running '{}' locally", artifact.name));
        return finish_local(handle, artifact);
    }

    std::cout << handle.id() << "\n";
    std::cerr << theme::ok(fmt::format("Submitted '{}' to {} as job {}",
                                       artifact.name, cluster.name(), handle.id()));
    if (!wait) return 0;

    std::cerr << theme::info(fmt::format("Waiting for job {}...", handle.id()));
    cluster.wait(handle);
    std::cerr << theme::ok(fmt::format("Job {} is no longer running (output: {})",
                                       handle.id(), artifact.stdout_path));
    return 0;
}

static int do_submit(BatchqCLI& cli, const CliOptions& opts) {
    return submit_job(cli, opts, false);
}

static int do_run(BatchqCLI& cli, const CliOptions& opts) {
    return submit_job(cli, opts, true);
}

static int do_wait(BatchqCLI& cli, const CliOptions& opts) {
    auto& cluster = cli.cluster();
    if (cluster.kind() == BackendKind::Local) {
        std::cerr << theme::fail("Local jobs can only be waited on by the process that started them.");
        return 1;
    }
    if (opts.positional.empty()) {
        std::cerr << theme::fail("Usage: batchq wait <job-id>...");
        return 1;
    }

    std::vector<JobHandle> handles;
    for (const auto& id : opts.positional) {
        handles.push_back(JobHandle::parse(cluster.kind(), id));
    }

    std::cerr << theme::info(fmt::format("Waiting for {} {} job(s)...", handles.size(), cluster.name()));
    cluster.wait(handles);
    std::cerr << theme::ok("All jobs finished");
    return 0;
}

void register_job_commands(BatchqCLI& cli) {
    cli.add_command("script", do_script, "Write the job files and print their paths");
    cli.add_command("submit", do_submit, "Submit a job and print its ID");
    cli.add_command("run", do_run, "Submit a job and wait for it");
    cli.add_command("wait", do_wait, "Wait for scheduler job IDs to finish");
}
