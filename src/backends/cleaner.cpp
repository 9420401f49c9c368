#include "cleaner.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::vector<std::string> cleanup_suffixes(BackendKind kind) {
    std::vector<std::string> suffixes = {STDERR_SUFFIX, STDOUT_SUFFIX};
    switch (kind) {
        case BackendKind::Local:
            suffixes.push_back(CLUSTER_SUFFIX);
            break;
        case BackendKind::PBS:
            suffixes.push_back(QSUB_SUFFIX);
            break;
        case BackendKind::Slurm:
            suffixes.push_back(SBATCH_SUFFIX);
            suffixes.push_back(SLURM_SCRIPT_SUFFIX);
            break;
        default:
            throw ConfigError(fmt::format("no cleanup rules for backend '{}'", backend_name(kind)));
    }
    return suffixes;
}

std::set<std::string> clean_directory(const fs::path& dir, BackendKind kind) {
    const auto suffixes = cleanup_suffixes(kind);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw ConfigError(fmt::format("clean: '{}' is not a directory", dir.string()));
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }

    std::set<std::string> deleted;
    if (files.empty()) {
        batchq_log(fmt::format("clean: No files found in {}", dir.string()));
        return deleted;
    }

    for (const auto& path : files) {
        std::string fname = path.filename().string();
        for (const auto& suffix : suffixes) {
            if (!ends_with(fname, suffix)) continue;
            if (fs::remove(path, ec)) {
                deleted.insert(fname);
            } else if (ec) {
                throw BatchqError(fmt::format("clean: cannot remove {}: {}",
                                              path.string(), ec.message()));
            }
            break;
        }
    }

    batchq_log(fmt::format("clean: {} removed {} file(s) from {}",
                           backend_name(kind), deleted.size(), dir.string()));
    return deleted;
}
