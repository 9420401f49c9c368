#include "job.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

std::string backend_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::Local: return "local";
        case BackendKind::PBS:   return "pbs";
        case BackendKind::Slurm: return "slurm";
    }
    return fmt::format("unknown({})", static_cast<int>(kind));
}

BackendKind parse_backend_kind(const std::string& text) {
    std::string s = to_lower(text);
    trim(s);
    if (s == "local" || s == "normal" || s == "multiprocessing") return BackendKind::Local;
    if (s == "pbs" || s == "torque" || s == "pbs-style") return BackendKind::PBS;
    if (s == "slurm" || s == "slurm-style") return BackendKind::Slurm;
    throw ConfigError(fmt::format(
        "backend '{}' is not recognized, should be: local, pbs, or slurm", text));
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

JobHandle JobHandle::scheduler(BackendKind kind, const std::string& job_id) {
    if (kind != BackendKind::PBS && kind != BackendKind::Slurm) {
        throw ConfigError(fmt::format(
            "backend '{}' does not use scheduler job IDs (got '{}')",
            backend_name(kind), job_id));
    }
    if (!all_digits(job_id)) {
        throw ConfigError(fmt::format(
            "{} job ID must be numeric, got '{}'", backend_name(kind), job_id));
    }
    JobHandle h;
    h.kind_ = kind;
    h.id_ = job_id;
    return h;
}

JobHandle JobHandle::local(const std::string& name, std::shared_future<int> result) {
    JobHandle h;
    h.kind_ = BackendKind::Local;
    h.id_ = name;
    h.result_ = std::move(result);
    return h;
}

JobHandle JobHandle::parse(BackendKind kind, const std::string& text) {
    std::string id = text;
    trim(id);
    if (kind == BackendKind::PBS) {
        id = id.substr(0, id.find('.'));
    }
    return scheduler(kind, id);
}

void require_backend(const std::vector<JobHandle>& handles, BackendKind kind,
                     const std::string& what) {
    for (const auto& h : handles) {
        if (h.kind() != kind) {
            throw ConfigError(fmt::format(
                "{} '{}' belongs to backend '{}', active backend is '{}'",
                what, h.id(), backend_name(h.kind()), backend_name(kind)));
        }
        if (h.is_local() && !h.result().valid()) {
            throw ConfigError(fmt::format("{} '{}' has no result to wait on", what, h.id()));
        }
    }
}
