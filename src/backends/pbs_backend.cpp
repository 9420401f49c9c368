#include "pbs_backend.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <iterator>
#include <set>

PBSBackend::PBSBackend(BackendOptions options) : Backend(std::move(options)) {}

std::string parse_qsub_job_id(const std::string& output) {
    std::string s = output;
    trim(s);
    std::string id = s.substr(0, s.find('.'));
    if (id.empty() || id.find_first_not_of("0123456789") != std::string::npos) {
        throw SubmissionError(fmt::format("pbs: cannot read a job ID from qsub output '{}'", s));
    }
    return id;
}

std::map<std::string, std::string> parse_qstat_table(const std::string& output) {
    std::map<std::string, std::string> states;

    std::string text = output;
    trim(text);
    // qstat prints nothing at all when the queue is empty
    if (text.empty()) return states;

    // Keep the leading blank line: the layout is defined by line offsets
    std::string body = output;
    body.erase(body.find_last_not_of(" \t\r\n") + 1);
    auto lines = split_lines(body);

    if (static_cast<int>(lines.size()) <= QSTAT_HEADER_LINE) {
        throw ConfigError(fmt::format(
            "pbs: unrecognized qstat format, expected a header on line {} but got {} line(s)",
            QSTAT_HEADER_LINE + 1, lines.size()));
    }
    auto header = split_spaces(lines[QSTAT_HEADER_LINE], 2);
    if (static_cast<int>(header.size()) <= QSTAT_STATE_FIELD || header[QSTAT_STATE_FIELD] != "S") {
        throw ConfigError(fmt::format(
            "pbs: unrecognized qstat format, header is '{}'", lines[QSTAT_HEADER_LINE]));
    }

    for (std::size_t i = QSTAT_FIRST_DATA_LINE; i < lines.size(); i++) {
        auto fields = split_spaces(lines[i]);
        if (fields.empty()) continue;
        std::string id = fields[0].substr(0, fields[0].find('.'));
        std::string state = static_cast<int>(fields.size()) > QSTAT_STATE_FIELD
                                ? fields[QSTAT_STATE_FIELD] : "";
        states[id] = state;
    }
    return states;
}

JobHandle PBSBackend::submit(const JobArtifact& artifact,
                             const std::vector<JobHandle>& dependencies) {
    check_artifact(artifact);
    require_backend(dependencies, kind(), "dependency");

    std::vector<std::string> args;
    if (!dependencies.empty()) {
        std::vector<std::string> clauses;
        for (const auto& d : dependencies) clauses.push_back("afterok:" + d.id());
        args.push_back("-W");
        args.push_back("depend=" + join(clauses, ","));
    }
    args.push_back(artifact.script);

    auto result = run_with_retry(QSUB_BIN, args);
    std::string id = parse_qsub_job_id(result.stdout_data);
    batchq_log(fmt::format("pbs: submitted '{}' as {}", artifact.name, id));
    return JobHandle::scheduler(kind(), id);
}

void PBSBackend::wait(const std::vector<JobHandle>& handles) {
    require_backend(handles, kind(), "job");

    std::set<std::string> pending;
    for (const auto& h : handles) pending.insert(h.id());
    if (pending.empty()) return;

    const auto& policy = options_.pbs_poll;
    sleep(policy.initial_delay);

    while (true) {
        const std::vector<std::string> args = {"-a"};
        auto result = run(QSTAT_BIN, args);
        if (result.failed()) {
            batchq_log_cmd("pbs:wait", QSTAT_BIN, args, result);
            std::string out = result.get_output();
            trim(out);
            throw QueryError(fmt::format("pbs: qstat -a failed (exit {}): {}",
                                         result.exit_code, out));
        }

        auto states = parse_qstat_table(result.stdout_data);
        for (auto it = pending.begin(); it != pending.end();) {
            auto st = states.find(*it);
            bool done = st == states.end() ? options_.pbs_missing_is_complete
                                           : st->second == "C";
            it = done ? pending.erase(it) : std::next(it);
        }

        if (pending.empty()) return;
        sleep(policy.interval);
    }
}
