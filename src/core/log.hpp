#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Debug log. Defaults to <tmp>/batchq_debug.log; the config `log_file` key
// moves it. Safe to call from worker threads.
std::string batchq_log_path();
void set_batchq_log_path(const std::string& path);

void batchq_log(const std::string& msg);

// Log an external tool invocation and its (truncated) output.
void batchq_log_cmd(const std::string& label, const std::string& program,
                    const std::vector<std::string>& args, const CommandResult& r);
