#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Owns a spawned child process. Move-only.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process was successfully spawned and not yet reaped.
    bool valid() const;

    // Block until the process exits. Returns its exit code, 128+N for a
    // process killed by signal N, -1 for an invalid handle.
    int wait();

private:
    int pid_ = -1;
    int exit_code_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stdout_path,
                               const std::string& stderr_path);
};

// Spawn a child process with stdin on /dev/null. A non-empty stdout_path /
// stderr_path truncates that file and redirects the stream into it.
// An exec failure surfaces as exit code 127 from wait().
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stdout_path = "",
                    const std::string& stderr_path = "");

// Run to completion and capture both streams. Matches the CommandRunner
// signature; this is the runner used against real schedulers.
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args);

} // namespace platform
