#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <vector>

namespace indiweb {
namespace server {

// ServerProcess manages the lifecycle of the indiserver child process
// Responsibilities:
// - Spawn process in the INDI config directory, output to an optional log file
// - Liveness probe that also reaps a process that died out-of-band
// - Graceful (SIGTERM) then forced (SIGKILL) shutdown
class ServerProcess {
public:
    ServerProcess(const std::string &executable, const std::vector<std::string> &args,
                  const std::string &working_dir = "", const std::string &log_file = "");
    ~ServerProcess();

    // Delete copy/move
    ServerProcess(const ServerProcess &) = delete;
    ServerProcess &operator=(const ServerProcess &) = delete;

    // Spawn the process
    // Returns true on success, false on failure (sets error_)
    bool spawn();

    // Check if process is still running (reaps it if it has exited)
    bool is_running();

    // Shutdown sequence: SIGTERM -> wait grace_ms -> SIGKILL
    void shutdown(int grace_ms);

    pid_t pid() const { return pid_; }

    // Raw waitpid status of the reaped process, if it has been reaped
    std::optional<int> exit_status() const { return exit_status_; }

    // Human readable exit reason ("exit code 1", "signal 9")
    std::string describe_exit() const;

    const std::string &executable() const { return executable_; }
    const std::string &last_error() const { return error_; }

private:
    std::string executable_;
    std::vector<std::string> args_;
    std::string working_dir_;
    std::string log_file_;
    std::string error_;

    pid_t pid_;
    std::optional<int> exit_status_;

    bool wait_for_exit(int timeout_ms);
    void reaped(int status);
};

}  // namespace server
}  // namespace indiweb
