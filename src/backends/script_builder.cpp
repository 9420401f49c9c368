#include "script_builder.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/resource_spec.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ── Validation ──────────────────────────────────────────────

static const char* JOB_NAME_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789._+-";

void validate_job_spec(const JobSpec& spec) {
    if (spec.name.empty()) {
        throw ConfigError("job name is required, it names every job file");
    }
    // The name lands in file names, scheduler directives and shell lines
    if (spec.name == "." || spec.name == ".." ||
        spec.name.find_first_not_of(JOB_NAME_CHARS) != std::string::npos) {
        throw ConfigError(fmt::format(
            "job name '{}' must be a plain file name of letters, digits, '.', '_', '+' or '-'",
            spec.name));
    }
    if (spec.command.empty()) {
        throw ConfigError(fmt::format("job '{}' has no command", spec.name));
    }
    if (!spec.memory.empty() && parse_memory_mb(spec.memory) <= 0) {
        throw ConfigError(fmt::format("job '{}': memory '{}' is not a memory size",
                                      spec.name, spec.memory));
    }
    if (!spec.time.empty() && !is_valid_walltime(spec.time)) {
        throw ConfigError(fmt::format("job '{}': time '{}' is not a walltime",
                                      spec.name, spec.time));
    }
}

std::string resolve_job_dir(const JobSpec& spec) {
    fs::path dir = spec.dir.empty() ? fs::current_path() : fs::absolute(spec.dir);
    dir = dir.lexically_normal();
    std::string s = dir.string();
    // lexically_normal keeps a trailing separator ("/a/b/")
    if (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

// ── Fragments ───────────────────────────────────────────────

std::string render_preamble(const std::string& dir, const std::string& name) {
    return fmt::format("cd {}\n"
                       "date +'%d-%H:%M:%S'\n"
                       "echo \"Running {}\"\n",
                       shell_quote(dir), name);
}

std::string render_postamble() {
    return "exitcode=$?\n"
           "echo Done\n"
           "date +'%d-%H:%M:%S'\n"
           "if [[ $exitcode != 0 ]]; then\n"
           "    echo Exited with code: $exitcode >&2\n"
           "    exit $exitcode\n"
           "fi\n";
}

std::string render_module_loads(const std::vector<std::string>& modules) {
    std::string s;
    for (const auto& m : modules) {
        s += fmt::format("module load {}\n", m);
    }
    return s;
}

static std::string job_body(const JobSpec& spec, const std::string& dir) {
    return render_preamble(dir, spec.name) + spec.command + "\n" + render_postamble();
}

static std::string output_path(const std::string& dir, const std::string& name,
                               const char* suffix) {
    return (fs::path(dir) / (name + suffix)).string();
}

std::string render_local_script(const JobSpec& spec, const std::string& dir) {
    return "#!/bin/bash\n" + job_body(spec, dir);
}

std::string render_qsub_script(const JobSpec& spec, const std::string& dir) {
    std::string s = "#!/bin/bash\n";
    if (!spec.partition.empty()) {
        s += fmt::format("#PBS -q {}\n", spec.partition);
    }
    // Only ever one node
    s += fmt::format("#PBS -l nodes=1:ppn={}\n", effective_cores(spec.cores));
    if (!spec.time.empty()) {
        s += fmt::format("#PBS -l walltime={}\n", spec.time);
    }
    if (!spec.memory.empty()) {
        s += fmt::format("#PBS -l mem={}MB\n", parse_memory_mb(spec.memory));
    }
    s += fmt::format("#PBS -o {}\n", output_path(dir, spec.name, STDOUT_SUFFIX));
    s += fmt::format("#PBS -e {}\n\n", output_path(dir, spec.name, STDERR_SUFFIX));
    s += "mkdir -p $LOCAL_SCRATCH\n";
    s += render_module_loads(spec.modules);
    s += job_body(spec, dir);
    return s;
}

std::string render_sbatch_script(const JobSpec& spec, const std::string& dir) {
    std::string s = "#!/bin/bash\n";
    if (!spec.partition.empty()) {
        s += fmt::format("#SBATCH -p {}\n", spec.partition);
    }
    s += "#SBATCH --ntasks 1\n";
    s += fmt::format("#SBATCH --cpus-per-task {}\n", effective_cores(spec.cores));
    if (!spec.time.empty()) {
        s += fmt::format("#SBATCH --time={}\n", spec.time);
    }
    if (!spec.memory.empty()) {
        s += fmt::format("#SBATCH --mem={}\n", parse_memory_mb(spec.memory));
    }
    s += fmt::format("#SBATCH -o {}\n", output_path(dir, spec.name, STDOUT_SUFFIX));
    s += fmt::format("#SBATCH -e {}\n", output_path(dir, spec.name, STDERR_SUFFIX));
    s += fmt::format("cd {}\n", shell_quote(dir));
    s += fmt::format("srun bash {}\n",
                     shell_quote(output_path(dir, spec.name, SLURM_SCRIPT_SUFFIX)));
    return s;
}

std::string render_slurm_body(const JobSpec& spec, const std::string& dir) {
    std::string s = "#!/bin/bash\n";
    s += "mkdir -p $LOCAL_SCRATCH\n";
    s += render_module_loads(spec.modules);
    s += job_body(spec, dir);
    return s;
}

// ── Writing ─────────────────────────────────────────────────

static void write_script(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw BatchqError(fmt::format("Cannot write job file: {}", path));
    }
    out << content;
    out.close();
    if (!out) {
        throw BatchqError(fmt::format("Failed writing job file: {}", path));
    }

    std::error_code ec;
    fs::permissions(path, fs::perms::owner_exec | fs::perms::group_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        batchq_log(fmt::format("chmod +x {} failed: {}", path, ec.message()));
    }
}

JobArtifact build_job_script(const JobSpec& spec, BackendKind kind) {
    if (kind != BackendKind::Local && kind != BackendKind::PBS && kind != BackendKind::Slurm) {
        throw ConfigError(fmt::format("cannot build job '{}' for backend '{}'",
                                      spec.name, backend_name(kind)));
    }
    validate_job_spec(spec);

    JobArtifact a;
    a.kind = kind;
    a.name = spec.name;
    a.dir = resolve_job_dir(spec);
    // #PBS/#SBATCH -o/-e are read by the scheduler, not bash, so they can't be quoted
    if (kind != BackendKind::Local && shell_quote(a.dir) != a.dir) {
        throw ConfigError(fmt::format(
            "{} job '{}': directory '{}' has characters scheduler directives can't carry",
            backend_name(kind), spec.name, a.dir));
    }
    a.stdout_path = output_path(a.dir, spec.name, STDOUT_SUFFIX);
    a.stderr_path = output_path(a.dir, spec.name, STDERR_SUFFIX);

    std::error_code ec;
    fs::create_directories(a.dir, ec);
    if (ec) {
        throw BatchqError(fmt::format("Cannot create job directory {}: {}", a.dir, ec.message()));
    }

    switch (kind) {
        case BackendKind::Local:
            a.script = output_path(a.dir, spec.name, CLUSTER_SUFFIX);
            write_script(a.script, render_local_script(spec, a.dir));
            break;
        case BackendKind::PBS:
            a.script = output_path(a.dir, spec.name, QSUB_SUFFIX);
            write_script(a.script, render_qsub_script(spec, a.dir));
            break;
        case BackendKind::Slurm:
            a.script = output_path(a.dir, spec.name, SBATCH_SUFFIX);
            a.companion = output_path(a.dir, spec.name, SLURM_SCRIPT_SUFFIX);
            write_script(a.script, render_sbatch_script(spec, a.dir));
            write_script(a.companion, render_slurm_body(spec, a.dir));
            break;
    }

    batchq_log(fmt::format("build: {} job '{}' -> {}", backend_name(kind), spec.name, a.script));
    return a;
}
