#include "server_supervisor.hpp"

#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <thread>

#include "logging/logger.hpp"

namespace indiweb {
namespace server {

const char *server_state_to_string(ServerState state) {
    switch (state) {
        case ServerState::STOPPED:
            return "STOPPED";
        case ServerState::STARTING:
            return "STARTING";
        case ServerState::RUNNING:
            return "RUNNING";
        case ServerState::STOPPING:
            return "STOPPING";
        default:
            return "UNKNOWN";
    }
}

ServerSupervisor::ServerSupervisor(const ServerConfig &config, std::shared_ptr<IDriverConnector> connector)
    : config_(config), connector_(std::move(connector)) {
    if (!connector_) {
        connector_ = std::make_shared<XmlSwitchConnector>(config_.connect_host, config_.connect_timeout_ms);
    }
}

ServerSupervisor::~ServerSupervisor() { stop(); }

SupervisorResult ServerSupervisor::start(int port, const std::vector<driver::DriverDescriptor> &drivers,
                                         const std::string &config_dir) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == ServerState::RUNNING) {
        check_alive_locked();
    }
    if (state_ != ServerState::STOPPED) {
        LOG_WARN("[Supervisor] start() rejected: server is " << server_state_to_string(state_));
        return SupervisorResult::failure(SupervisorErrorCode::ALREADY_RUNNING,
                                         std::string("Server is ") + server_state_to_string(state_));
    }

    // Reject undeliverable directives before anything is spawned
    for (const auto &descriptor : drivers) {
        std::string error;
        if (!ControlChannel::format_start(descriptor, error)) {
            return SupervisorResult::failure(SupervisorErrorCode::INVALID_ARGUMENT, error);
        }
    }

    state_ = ServerState::STARTING;
    ++generation_;
    port_ = port;

    LOG_INFO("[Supervisor] Starting indiserver on port " << port << " with " << drivers.size() << " driver(s)");

    std::string error;
    if (!prepare_fifo_locked(error)) {
        LOG_ERROR("[Supervisor] " << error);
        teardown_locked();
        return SupervisorResult::failure(SupervisorErrorCode::START_FAILED, error);
    }

    std::vector<std::string> args = {"-v", "-p", std::to_string(port), "-m", std::to_string(config_.max_queue_mb),
                                     "-r", "0", "-f", config_.fifo_path};
    args.insert(args.end(), config_.extra_args.begin(), config_.extra_args.end());

    process_ = std::make_unique<ServerProcess>(config_.executable, args, config_dir, config_.log_file);
    if (!process_->spawn()) {
        error = "Failed to spawn " + config_.executable + ": " + process_->last_error();
        LOG_ERROR("[Supervisor] " << error);
        teardown_locked();
        return SupervisorResult::failure(SupervisorErrorCode::START_FAILED, error);
    }

    channel_ = std::make_unique<ControlChannel>(config_.fifo_path);
    if (!wait_for_channel_locked(error)) {
        LOG_ERROR("[Supervisor] " << error);
        teardown_locked();
        return SupervisorResult::failure(SupervisorErrorCode::START_FAILED, error);
    }

    for (const auto &descriptor : drivers) {
        if (!channel_->send_start(descriptor)) {
            error = "Failed to start driver '" + descriptor.label + "': " + channel_->last_error();
            LOG_ERROR("[Supervisor] " << error);
            teardown_locked();
            return SupervisorResult::failure(SupervisorErrorCode::START_FAILED, error);
        }
        running_drivers_[descriptor.label] = descriptor;
        LOG_INFO("[Supervisor] Driver '" << descriptor.label << "' (" << descriptor.binary << ") started");
    }

    state_ = ServerState::RUNNING;
    LOG_INFO("[Supervisor] indiserver running (PID=" << process_->pid() << ", port " << port << ")");
    return SupervisorResult::ok();
}

void ServerSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ServerState::STOPPED && !process_) {
            return;
        }
        ++generation_;
        state_ = ServerState::STOPPING;
        LOG_INFO("[Supervisor] Stopping indiserver");
    }

    // A deferred sweep may be waiting for mutex_, so cancel outside the lock
    auto_connect_timer_.cancel();

    std::lock_guard<std::mutex> lock(mutex_);
    teardown_locked();
    LOG_INFO("[Supervisor] indiserver stopped");
}

SupervisorResult ServerSupervisor::start_driver(const driver::DriverDescriptor &descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!check_alive_locked()) {
        return SupervisorResult::failure(SupervisorErrorCode::NOT_RUNNING, "Server is not running");
    }

    std::string error;
    if (!ControlChannel::format_start(descriptor, error)) {
        return SupervisorResult::failure(SupervisorErrorCode::INVALID_ARGUMENT, error);
    }

    if (!channel_->send_start(descriptor)) {
        LOG_ERROR("[Supervisor] start directive for '" << descriptor.label << "' failed: " << channel_->last_error());
        return SupervisorResult::failure(SupervisorErrorCode::CHANNEL_UNAVAILABLE, channel_->last_error());
    }

    running_drivers_[descriptor.label] = descriptor;
    LOG_INFO("[Supervisor] Driver '" << descriptor.label << "' started");
    return SupervisorResult::ok();
}

SupervisorResult ServerSupervisor::stop_driver(const driver::DriverDescriptor &descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!check_alive_locked()) {
        return SupervisorResult::failure(SupervisorErrorCode::NOT_RUNNING, "Server is not running");
    }

    std::string error;
    if (!ControlChannel::format_stop(descriptor, error)) {
        return SupervisorResult::failure(SupervisorErrorCode::INVALID_ARGUMENT, error);
    }

    if (!channel_->send_stop(descriptor)) {
        LOG_ERROR("[Supervisor] stop directive for '" << descriptor.label << "' failed: " << channel_->last_error());
        return SupervisorResult::failure(SupervisorErrorCode::CHANNEL_UNAVAILABLE, channel_->last_error());
    }

    running_drivers_.erase(descriptor.label);
    LOG_INFO("[Supervisor] Driver '" << descriptor.label << "' stopped");
    return SupervisorResult::ok();
}

SupervisorResult ServerSupervisor::restart_driver(const driver::DriverDescriptor &descriptor) {
    auto stopped = stop_driver(descriptor);
    if (!stopped.success) {
        return stopped;
    }
    return start_driver(descriptor);
}

bool ServerSupervisor::is_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_alive_locked();
}

RunningDrivers ServerSupervisor::running_drivers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_drivers_;
}

ServerState ServerSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<int> ServerSupervisor::port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ServerState::RUNNING) {
        return std::nullopt;
    }
    return port_;
}

std::optional<pid_t> ServerSupervisor::server_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_ || process_->pid() <= 0) {
        return std::nullopt;
    }
    return process_->pid();
}

uint64_t ServerSupervisor::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

SupervisorResult ServerSupervisor::auto_connect(AutoConnectReport *report) {
    std::vector<driver::DriverDescriptor> drivers;
    int port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!check_alive_locked()) {
            return SupervisorResult::failure(SupervisorErrorCode::NOT_RUNNING, "Server is not running");
        }
        for (const auto &[label, descriptor] : running_drivers_) {
            drivers.push_back(descriptor);
        }
        port = port_;
    }

    // Network I/O happens on a snapshot, outside the lock
    AutoConnectReport result = sweep(drivers, port);
    if (report != nullptr) {
        *report = std::move(result);
    }
    return SupervisorResult::ok();
}

SupervisorResult ServerSupervisor::list_devices(std::vector<DeviceStatus> &devices) {
    int port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!check_alive_locked()) {
            return SupervisorResult::failure(SupervisorErrorCode::NOT_RUNNING, "Server is not running");
        }
        port = port_;
    }

    std::string error;
    if (!connector_->list_devices(port, devices, error)) {
        LOG_WARN("[Supervisor] Device query on port " << port << " failed: " << error);
        return SupervisorResult::failure(SupervisorErrorCode::CHANNEL_UNAVAILABLE, error);
    }
    return SupervisorResult::ok();
}

SupervisorResult ServerSupervisor::schedule_auto_connect(std::chrono::milliseconds delay) {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!check_alive_locked()) {
            return SupervisorResult::failure(SupervisorErrorCode::NOT_RUNNING, "Server is not running");
        }
        generation = generation_;
    }

    LOG_INFO("[Supervisor] Auto-connect scheduled in " << delay.count() << "ms");
    auto_connect_timer_.schedule(delay, [this, generation] { run_deferred_auto_connect(generation); });
    return SupervisorResult::ok();
}

void ServerSupervisor::run_deferred_auto_connect(uint64_t generation) {
    std::vector<driver::DriverDescriptor> drivers;
    int port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            LOG_DEBUG("[Supervisor] Deferred auto-connect dropped (server restarted or stopped)");
            return;
        }
        if (!check_alive_locked()) {
            LOG_DEBUG("[Supervisor] Deferred auto-connect dropped (server not running)");
            return;
        }
        for (const auto &[label, descriptor] : running_drivers_) {
            drivers.push_back(descriptor);
        }
        port = port_;
    }

    sweep(drivers, port);
}

AutoConnectReport ServerSupervisor::sweep(const std::vector<driver::DriverDescriptor> &drivers, int port) {
    std::vector<driver::DriverDescriptor> ordered = drivers;
    std::sort(ordered.begin(), ordered.end(),
              [](const driver::DriverDescriptor &a, const driver::DriverDescriptor &b) { return a.label < b.label; });

    AutoConnectReport report;
    for (const auto &descriptor : ordered) {
        ++report.attempted;
        std::string error;
        if (connector_->connect(descriptor, port, error)) {
            ++report.connected;
        } else {
            LOG_WARN("[AutoConnect] '" << descriptor.label << "' not connected: " << error);
            report.failures.push_back(descriptor.label + ": " + error);
        }
    }

    LOG_INFO("[AutoConnect] " << report.connected << "/" << report.attempted << " driver(s) connected");
    return report;
}

bool ServerSupervisor::check_alive_locked() {
    if (state_ != ServerState::RUNNING) {
        return false;
    }
    if (process_ && process_->is_running()) {
        return true;
    }

    LOG_WARN("[Supervisor] indiserver exited unexpectedly ("
             << (process_ ? process_->describe_exit() : std::string("no process")) << ")");
    teardown_locked();
    return false;
}

void ServerSupervisor::teardown_locked() {
    ++generation_;

    if (channel_) {
        channel_->close();
        channel_.reset();
    }

    if (process_) {
        process_->shutdown(config_.shutdown_timeout_ms);
        process_.reset();
    }

    if (!running_drivers_.empty()) {
        LOG_DEBUG("[Supervisor] Forgetting " << running_drivers_.size() << " running driver(s)");
    }
    running_drivers_.clear();
    port_ = 0;
    state_ = ServerState::STOPPED;
}

bool ServerSupervisor::prepare_fifo_locked(std::string &error) {
    const std::string &path = config_.fifo_path;

    // A stale FIFO may still hold directives from a previous server
    struct stat st;
    if (::lstat(path.c_str(), &st) == 0) {
        if (::unlink(path.c_str()) != 0) {
            error = "Cannot remove stale FIFO " + path + ": " + std::string(strerror(errno));
            return false;
        }
    }

    if (::mkfifo(path.c_str(), 0666) != 0) {
        error = "Cannot create FIFO " + path + ": " + std::string(strerror(errno));
        return false;
    }
    return true;
}

bool ServerSupervisor::wait_for_channel_locked(std::string &error) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.startup_timeout_ms);

    while (true) {
        if (!process_->is_running()) {
            error = config_.executable + " exited during startup (" + process_->describe_exit() + ")";
            return false;
        }

        if (channel_->open()) {
            return true;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            error = "Control FIFO not available after " + std::to_string(config_.startup_timeout_ms) +
                    "ms: " + channel_->last_error();
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(config_.fifo_retry_ms));
    }
}

}  // namespace server
}  // namespace indiweb
