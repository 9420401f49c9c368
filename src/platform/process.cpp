#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace platform {

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

static pid_t waitpid_retry(pid_t pid, int* status, int options) {
    pid_t ret;
    do {
        ret = waitpid(pid, status, options);
    } while (ret < 0 && errno == EINTR);
    return ret;
}

// Child side: replace the process image, never returns.
[[noreturn]] static void exec_child(const std::string& program,
                                    const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    execvp(program.c_str(), const_cast<char* const*>(argv.data()));
    _exit(127);  // exec failed
}

// Jobs that read stdin see EOF rather than a closed descriptor.
static void stdin_from_dev_null() {
    int fd = open("/dev/null", O_RDONLY);
    if (fd < 0) _exit(126);
    dup2(fd, STDIN_FILENO);
    if (fd != STDIN_FILENO) close(fd);
}

static void redirect_to_file(const std::string& path, int target_fd) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) _exit(126);
    dup2(fd, target_fd);
    close(fd);
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Reap so a forgotten handle doesn't leave a zombie behind
    if (pid_ > 0) wait();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0) wait();
        pid_ = other.pid_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return exit_code_;
    int status = 0;
    if (waitpid_retry(pid_, &status, 0) == pid_) {
        exit_code_ = decode_status(status);
    }
    pid_ = -1;
    return exit_code_;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stdout_path,
                    const std::string& stderr_path) {
    ProcessHandle handle;

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        stdin_from_dev_null();
        if (!stdout_path.empty()) redirect_to_file(stdout_path, STDOUT_FILENO);
        if (!stderr_path.empty()) redirect_to_file(stderr_path, STDERR_FILENO);
        exec_child(program, args);
    }

    handle.pid_ = pid;
    return handle;
}

// ── run_command ──────────────────────────────────────────────

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args) {
    CommandResult result{-1, "", ""};

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe(err_pipe) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_data = std::string("fork failed: ") + std::strerror(errno);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        return result;
    }

    if (pid == 0) {
        stdin_from_dev_null();
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        exec_child(program, args);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    // Drain both pipes together so a chatty stderr can't block stdout
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_fds = 2;
    char buf[4096];
    while (open_fds > 0) {
        int n = poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t r = read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                sinks[i]->append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    int status = 0;
    if (waitpid_retry(pid, &status, 0) == pid) {
        result.exit_code = decode_status(status);
    }
    return result;
}

} // namespace platform
