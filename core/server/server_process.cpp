#include "server_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#include "logging/logger.hpp"

namespace indiweb {
namespace server {

ServerProcess::ServerProcess(const std::string &executable, const std::vector<std::string> &args,
                             const std::string &working_dir, const std::string &log_file)
    : executable_(executable), args_(args), working_dir_(working_dir), log_file_(log_file), pid_(-1) {}

ServerProcess::~ServerProcess() { shutdown(500); }

bool ServerProcess::spawn() {
    LOG_INFO("[Process] Spawning: " << executable_);

    if (pid_ > 0) {
        error_ = "Process already spawned (PID=" + std::to_string(pid_) + ")";
        return false;
    }

    // Paths are checked up front; bare names are resolved through PATH by execvp
    if (executable_.find('/') != std::string::npos && !std::filesystem::exists(executable_)) {
        error_ = "Executable not found: " + executable_;
        LOG_ERROR("[Process] " << error_);
        return false;
    }

    // Open the log file before forking so failures are reported in the parent
    int log_fd = -1;
    if (!log_file_.empty()) {
        log_fd = ::open(log_file_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (log_fd < 0) {
            LOG_WARN("[Process] Cannot open server log " << log_file_ << ": " << strerror(errno));
        }
    }

    // Construct argv before fork (no allocation in the child)
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(executable_.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    exit_status_.reset();
    pid_ = fork();
    if (pid_ < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        pid_ = -1;
        if (log_fd >= 0) {
            ::close(log_fd);
        }
        return false;
    }

    if (pid_ == 0) {
        // Child process
        if (log_fd >= 0) {
            dup2(log_fd, STDOUT_FILENO);
            dup2(log_fd, STDERR_FILENO);
        }

        // Own process group so terminal signals aimed at us do not hit it twice
        setpgid(0, 0);

        if (!working_dir_.empty() && chdir(working_dir_.c_str()) != 0) {
            _exit(126);
        }

        execvp(argv[0], argv.data());

        // If we get here, exec failed
        _exit(127);
    }

    // Parent process
    if (log_fd >= 0) {
        ::close(log_fd);
    }

    LOG_INFO("[Process] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

void ServerProcess::reaped(int status) {
    exit_status_ = status;
    LOG_INFO("[Process] PID " << pid_ << " exited (" << describe_exit() << ")");
    pid_ = -1;
}

std::string ServerProcess::describe_exit() const {
    if (!exit_status_) {
        return "not exited";
    }
    const int status = *exit_status_;
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

bool ServerProcess::is_running() {
    if (pid_ <= 0) return false;

    // kill(pid, 0) succeeds for a zombie, so reap instead of probing
    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == pid_) {
        reaped(status);
        return false;
    }
    if (result == -1 && errno == ECHILD) {
        // Reaped elsewhere
        pid_ = -1;
        return false;
    }
    return true;
}

void ServerProcess::shutdown(int grace_ms) {
    if (!is_running()) {
        return;
    }

    LOG_INFO("[Process] Terminating PID " << pid_);

    // 1. Ask politely
    kill(pid_, SIGTERM);

    // 2. Wait with timeout
    bool exited = wait_for_exit(grace_ms);

    if (exited) {
        LOG_INFO("[Process] Clean shutdown");
    } else {
        // 3. Forced kill of the whole group, so drivers indiserver can no
        // longer reap go with it
        LOG_WARN("[Process] Timeout - forcing termination");
        if (pid_ > 0 && kill(-pid_, SIGKILL) != 0) {
            // Child had not reached setpgid() yet
            kill(pid_, SIGKILL);
        }
        wait_for_exit(500);
    }
}

bool ServerProcess::wait_for_exit(int timeout_ms) {
    if (pid_ <= 0) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            reaped(status);
            return true;
        }
        if (result == -1) {
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            if (errno == EINTR) {
                // Interrupted by signal, retry
                continue;
            }
            // Other error
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace server
}  // namespace indiweb
