#include <iostream>
#include <vector>
#include <string>
#include "cli/batchq_cli.hpp"
#include "cli/cli_options.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        BatchqCLI cli;

        auto parsed = parse_cli_args(std::vector<std::string>(argv + 1, argv + argc));
        if (parsed.is_err()) {
            std::cerr << theme::fail(parsed.error);
            cli.print_usage();
            return 1;
        }
        const CliOptions& opts = parsed.value;

        if (opts.version) {
            std::cout << "batchq version 0.1.0\n";
            return 0;
        }
        if (opts.help || opts.command.empty()) {
            cli.print_usage();
            return opts.help ? 0 : 1;
        }

        return cli.execute(opts);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
