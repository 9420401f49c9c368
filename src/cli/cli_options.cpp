#include "cli_options.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

static Result<int> parse_int_option(const std::string& opt, const std::string& value) {
    int n = safe_stoi(value, -1);
    if (n < 0 || value.find_first_not_of("0123456789") != std::string::npos) {
        return Result<int>::Err(fmt::format("{} expects a non-negative number, got '{}'", opt, value));
    }
    return Result<int>::Ok(n);
}

Result<CliOptions> parse_cli_args(const std::vector<std::string>& args) {
    CliOptions o;

    for (std::size_t i = 0; i < args.size(); i++) {
        std::string arg = args[i];

        if (arg == "--") {
            std::vector<std::string> words(args.begin() + static_cast<long>(i) + 1, args.end());
            if (words.size() == 1) {
                // One argument is already a shell command line ("a | b")
                o.job_command = words[0];
            } else {
                for (auto& w : words) w = shell_quote(w);
                o.job_command = join(words, " ");
            }
            break;
        }
        if (arg == "-h" || arg == "--help") { o.help = true; continue; }
        if (arg == "--version") { o.version = true; continue; }

        if (arg.size() < 2 || arg[0] != '-') {
            if (o.command.empty()) {
                o.command = arg;
            } else {
                o.positional.push_back(arg);
            }
            continue;
        }

        // --opt=value
        std::string value;
        bool inline_value = false;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            inline_value = true;
        }

        auto take_value = [&]() -> Result<std::string> {
            if (inline_value) return Result<std::string>::Ok(value);
            if (i + 1 >= args.size()) {
                return Result<std::string>::Err(fmt::format("{} needs a value", arg));
            }
            return Result<std::string>::Ok(args[++i]);
        };

        auto v = take_value();
        if (v.is_err()) return Result<CliOptions>::Err(v.error);

        if (arg == "--backend" || arg == "-b") {
            o.backend = v.value;
        } else if (arg == "--name" || arg == "-n") {
            o.name = v.value;
        } else if (arg == "--time" || arg == "-t") {
            o.time = v.value;
        } else if (arg == "--mem" || arg == "-m") {
            o.memory = v.value;
        } else if (arg == "--partition" || arg == "-p") {
            o.partition = v.value;
        } else if (arg == "--dir" || arg == "-d") {
            o.dir = v.value;
        } else if (arg == "--config-dir") {
            o.config_dir = v.value;
        } else if (arg == "--module") {
            o.modules.push_back(v.value);
        } else if (arg == "--after") {
            for (const auto& id : split(v.value, ',')) {
                if (!id.empty()) o.after.push_back(id);
            }
        } else if (arg == "--cores" || arg == "-c") {
            auto n = parse_int_option(arg, v.value);
            if (n.is_err()) return Result<CliOptions>::Err(n.error);
            o.cores = n.value;
        } else if (arg == "--threads") {
            auto n = parse_int_option(arg, v.value);
            if (n.is_err()) return Result<CliOptions>::Err(n.error);
            o.threads = n.value;
        } else {
            return Result<CliOptions>::Err(fmt::format("Unknown option: {}", arg));
        }
    }

    return Result<CliOptions>::Ok(o);
}
