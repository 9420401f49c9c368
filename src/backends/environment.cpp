#include "environment.hpp"
#include "local_backend.hpp"
#include "pbs_backend.hpp"
#include "slurm_backend.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

BackendKind detect_backend(const ToolProbe& probe) {
    auto has = [&probe](const std::string& program) {
        if (probe) return probe(program);
        return platform::which(program).has_value();
    };

    BackendKind kind = BackendKind::Local;
    if (has(SBATCH_BIN)) {
        kind = BackendKind::Slurm;
    } else if (has(QSUB_BIN)) {
        kind = BackendKind::PBS;
    }

    if (kind == BackendKind::Local) {
        batchq_log("detect: No cluster environment detected, using local worker pool");
    } else {
        batchq_log(fmt::format("detect: {} detected, using for cluster submissions",
                               backend_name(kind)));
    }
    return kind;
}

std::unique_ptr<Backend> make_backend(BackendKind kind, BackendOptions options) {
    switch (kind) {
        case BackendKind::Local: return std::make_unique<LocalBackend>(std::move(options));
        case BackendKind::PBS:   return std::make_unique<PBSBackend>(std::move(options));
        case BackendKind::Slurm: return std::make_unique<SlurmBackend>(std::move(options));
    }
    throw ConfigError(fmt::format("backend '{}' is not recognized, should be: local, pbs, or slurm",
                                  backend_name(kind)));
}
