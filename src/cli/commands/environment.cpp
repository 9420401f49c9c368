#include "../batchq_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <filesystem>
#include <fmt/format.h>

static int do_detect(BatchqCLI& cli, const CliOptions&) {
    std::cout << cli.cluster().name() << "\n";
    return 0;
}

static int do_clean(BatchqCLI& cli, const CliOptions& opts) {
    std::filesystem::path dir = opts.positional.empty() ? std::filesystem::current_path()
                                                        : std::filesystem::path(opts.positional[0]);
    auto deleted = cli.cluster().clean(dir);
    if (deleted.empty()) {
        std::cerr << theme::warn(fmt::format("No {} job files found in {}", cli.cluster().name(), dir.string()));
        return 0;
    }
    for (const auto& f : deleted) {
        std::cout << f << "\n";
    }
    std::cerr << theme::ok(fmt::format("Removed {} file(s)", deleted.size()));
    return 0;
}

void register_environment_commands(BatchqCLI& cli) {
    cli.add_command("detect", do_detect, "Print the backend in use");
    cli.add_command("clean", do_clean, "Delete job files and outputs in a directory");
}
