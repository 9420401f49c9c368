#pragma once

#include <string>
#include <memory>
#include <functional>
#include <core/types.hpp>
#include "backend.hpp"

// Answers "is this program on PATH?"
using ToolProbe = std::function<bool(const std::string& program)>;

// Pick the backend for this host: sbatch wins over qsub, and with neither
// we run locally. Never fails. Logs the choice to the debug log.
BackendKind detect_backend(const ToolProbe& probe = ToolProbe());

// Construct the backend for `kind`. Throws ConfigError for an unknown kind.
std::unique_ptr<Backend> make_backend(BackendKind kind, BackendOptions options = BackendOptions());
