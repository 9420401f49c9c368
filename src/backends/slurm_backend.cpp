#include "slurm_backend.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <iterator>
#include <set>

SlurmBackend::SlurmBackend(BackendOptions options) : Backend(std::move(options)) {}

std::string parse_sbatch_job_id(const std::string& output) {
    auto tokens = split_spaces(output);
    std::string id = tokens.empty() ? "" : tokens.back();
    trim(id);
    if (id.empty() || id.find_first_not_of("0123456789") != std::string::npos) {
        std::string s = output;
        trim(s);
        throw SubmissionError(fmt::format("slurm: cannot read a job ID from sbatch output '{}'", s));
    }
    return id;
}

std::map<std::string, std::string> parse_squeue_states(const std::string& output) {
    std::map<std::string, std::string> states;
    for (auto line : split_lines(output)) {
        trim(line);
        if (line.empty()) continue;
        // Older wrappers quote the format string literally
        if (line.front() == '\'') line.erase(0, 1);
        if (!line.empty() && line.back() == '\'') line.pop_back();

        auto comma = line.find(',');
        if (comma == std::string::npos) continue;
        std::string id = line.substr(0, comma);
        std::string state = line.substr(comma + 1);
        trim(id);
        trim(state);
        if (!id.empty()) states[id] = state;
    }
    return states;
}

JobHandle SlurmBackend::submit(const JobArtifact& artifact,
                               const std::vector<JobHandle>& dependencies) {
    check_artifact(artifact);
    require_backend(dependencies, kind(), "dependency");

    std::vector<std::string> args;
    if (!dependencies.empty()) {
        std::vector<std::string> ids;
        for (const auto& d : dependencies) ids.push_back(d.id());
        args.push_back("--dependency=afterok:" + join(ids, ":"));
    }
    args.push_back(artifact.script);

    auto result = run_with_retry(SBATCH_BIN, args);
    std::string id = parse_sbatch_job_id(result.stdout_data);
    batchq_log(fmt::format("slurm: submitted '{}' as {}", artifact.name, id));
    return JobHandle::scheduler(kind(), id);
}

void SlurmBackend::wait(const std::vector<JobHandle>& handles) {
    require_backend(handles, kind(), "job");

    std::set<std::string> pending;
    for (const auto& h : handles) pending.insert(h.id());
    if (pending.empty()) return;

    const auto& policy = options_.slurm_poll;
    sleep(policy.initial_delay);

    while (true) {
        const std::vector<std::string> args = {"-h", "-o", "%A,%t"};
        auto result = run(SQUEUE_BIN, args);
        if (result.failed()) {
            batchq_log_cmd("slurm:wait", SQUEUE_BIN, args, result);
            std::string out = result.get_output();
            trim(out);
            throw QueryError(fmt::format("slurm: squeue failed (exit {}): {}",
                                         result.exit_code, out));
        }

        auto states = parse_squeue_states(result.stdout_data);
        for (auto it = pending.begin(); it != pending.end();) {
            auto st = states.find(*it);
            bool done = st == states.end() || st->second == "CD" || st->second == "F";
            it = done ? pending.erase(it) : std::next(it);
        }

        if (pending.empty()) return;
        sleep(policy.interval);
    }
}
