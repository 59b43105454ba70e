#include "server_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <filesystem>
#include <thread>
#include <vector>

#include "logging/logger.hpp"

extern char **environ;

namespace tether {
namespace client {

namespace {

std::once_flag g_sigpipe_once;

// Writes to a dead child's stdin must surface as EPIPE, not kill the client
void ignore_sigpipe() {
    std::call_once(g_sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Parent environment with the configured overrides applied
std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides) {
    std::vector<std::string> env;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(kv));
        }
    }
    for (const auto &[key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

}  // namespace

ServerProcess::ServerProcess(ServerConfig config) : config_(std::move(config)), pid_(-1) {}

ServerProcess::~ServerProcess() { shutdown(); }

bool ServerProcess::spawn() {
    error_.clear();

    if (config_.command_line.empty() || config_.command_line.front().empty()) {
        error_ = "Empty command line";
        LOG_ERROR("[" << config_.name << "] " << error_);
        return false;
    }

    const std::string &program = config_.command_line.front();
    LOG_INFO("[" << config_.name << "] Spawning: " << program);

    if (config_.working_directory && !std::filesystem::is_directory(*config_.working_directory)) {
        error_ = "Working directory not found: " + *config_.working_directory;
        LOG_ERROR("[" << config_.name << "] " << error_);
        return false;
    }

    // Explicit paths can be checked up front; bare names go through PATH lookup in exec.
    // The child chdirs before exec, so relative paths resolve against the working directory.
    if (program.find('/') != std::string::npos) {
        std::filesystem::path resolved(program);
        if (resolved.is_relative() && config_.working_directory) {
            resolved = std::filesystem::path(*config_.working_directory) / resolved;
        }
        if (!std::filesystem::exists(resolved)) {
            error_ = "Executable not found: " + program;
            LOG_ERROR("[" << config_.name << "] " << error_);
            return false;
        }
    }

    ignore_sigpipe();
    return spawn_posix();
}

bool ServerProcess::spawn_posix() {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // child reports exec failure here; CLOEXEC closes it on success

    if (pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        return false;
    }
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create status pipe: " + std::string(strerror(errno));
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return false;
    }

    // Everything the child needs is prepared before fork: only async-signal-safe calls after it
    std::vector<std::string> env_strings = build_environment(config_.environment);
    std::vector<char *> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto &kv : env_strings) {
        envp.push_back(kv.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> args = config_.command_line;
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const char *workdir = config_.working_directory ? config_.working_directory->c_str() : nullptr;

    pid_t child = fork();
    if (child < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        return false;
    }

    if (child == 0) {
        // dup2 clears FD_CLOEXEC on the standard descriptors
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        signal(SIGPIPE, SIG_DFL);

        int err = 0;
        if (workdir != nullptr && chdir(workdir) < 0) {
            err = errno;
        } else {
            execvpe(argv[0], argv.data(), envp.data());
            err = errno;
        }
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        error_ = "Failed to launch '" + config_.command_line.front() + "': " + std::string(strerror(child_errno));
        LOG_ERROR("[" << config_.name << "] " << error_);
        int status = 0;
        while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = child;
        exit_status_.reset();
    }
    started_at_ = std::chrono::steady_clock::now();
    stream_.set_handles(stdin_pipe[1], stdout_pipe[0]);

    LOG_INFO("[" << config_.name << "] Process spawned successfully (PID=" << child << ")");
    return true;
}

bool ServerProcess::reap_locked(bool block) const {
    if (pid_ <= 0) {
        return true;
    }
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        if (WIFEXITED(status)) {
            exit_status_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_status_ = 128 + WTERMSIG(status);
        }
        pid_ = -1;
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        pid_ = -1;
        return true;
    }
    return false;
}

bool ServerProcess::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) {
        return false;
    }
    return !reap_locked(false);
}

pid_t ServerProcess::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

std::optional<int> ServerProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

std::chrono::milliseconds ServerProcess::uptime() const {
    if (!is_running()) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
}

void ServerProcess::shutdown() {
    stream_.close_stdin();

    if (!is_running()) {
        return;
    }

    LOG_INFO("[" << config_.name << "] Initiating shutdown");

    if (wait_for_exit(config_.shutdown_timeout_ms)) {
        LOG_INFO("[" << config_.name << "] Clean shutdown");
        return;
    }

    LOG_WARN("[" << config_.name << "] Timeout - sending SIGTERM");
    signal_child(SIGTERM);
    if (wait_for_exit(500)) {
        return;
    }

    LOG_WARN("[" << config_.name << "] Still running - forcing termination");
    signal_child(SIGKILL);
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked(true);
}

bool ServerProcess::wait_for_exit(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reap_locked(false)) {
                return true;
            }
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ServerProcess::signal_child(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0) {
        kill(pid_, sig);
    }
}

}  // namespace client
}  // namespace tether
