#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "driver/driver_descriptor.hpp"
#include "server/control_channel.hpp"
#include "server/deferred_call.hpp"
#include "server/driver_connector.hpp"
#include "server/server_config.hpp"
#include "server/server_process.hpp"
#include "server/supervisor_result.hpp"

namespace indiweb {
namespace server {

enum class ServerState { STOPPED, STARTING, RUNNING, STOPPING };

const char *server_state_to_string(ServerState state);

struct AutoConnectReport {
    size_t attempted = 0;
    size_t connected = 0;
    std::vector<std::string> failures;  // "label: reason"
};

using RunningDrivers = std::unordered_map<std::string, driver::DriverDescriptor>;

// ServerSupervisor owns the indiserver process, its control FIFO and the set
// of drivers this process has commanded to run.
//
// Thread Safety:
// - Every state transition and running-set mutation happens under mutex_
// - The only internal thread is the deferred auto-connect timer
//
// The running set is only as accurate as the assumption that nobody else
// writes to the FIFO; it is never reconciled with indiserver.
class ServerSupervisor {
public:
    explicit ServerSupervisor(const ServerConfig &config,
                              std::shared_ptr<IDriverConnector> connector = nullptr);
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor &) = delete;
    ServerSupervisor &operator=(const ServerSupervisor &) = delete;

    // Spawn indiserver on port, wait for its FIFO, start drivers in order.
    // On failure the supervisor is back in STOPPED with nothing running.
    SupervisorResult start(int port, const std::vector<driver::DriverDescriptor> &drivers,
                           const std::string &config_dir);

    // Close the FIFO, terminate indiserver, forget all drivers. No-op when stopped.
    void stop();

    SupervisorResult start_driver(const driver::DriverDescriptor &descriptor);
    SupervisorResult stop_driver(const driver::DriverDescriptor &descriptor);
    SupervisorResult restart_driver(const driver::DriverDescriptor &descriptor);

    // RUNNING and the process is alive
    bool is_running();

    RunningDrivers running_drivers() const;

    // Send CONNECT to every running driver. Per-driver failures are logged
    // and reported, never abort the sweep.
    SupervisorResult auto_connect(AutoConnectReport *report = nullptr);

    // Devices the running server publishes, queried over its client port
    SupervisorResult list_devices(std::vector<DeviceStatus> &devices);

    // One-shot auto_connect() after delay, void if stop() happens first
    SupervisorResult schedule_auto_connect(std::chrono::milliseconds delay);
    bool auto_connect_pending() const { return auto_connect_timer_.pending(); }

    ServerState state() const;
    std::optional<int> port() const;
    std::optional<pid_t> server_pid() const;
    uint64_t generation() const;

private:
    ServerConfig config_;
    std::shared_ptr<IDriverConnector> connector_;

    mutable std::mutex mutex_;
    ServerState state_ = ServerState::STOPPED;
    uint64_t generation_ = 0;  // Bumped on every start/stop/detected death
    int port_ = 0;
    std::unique_ptr<ServerProcess> process_;
    std::unique_ptr<ControlChannel> channel_;
    RunningDrivers running_drivers_;

    DeferredCall auto_connect_timer_;

    // Helpers below require mutex_ to be held
    bool check_alive_locked();
    void teardown_locked();
    bool prepare_fifo_locked(std::string &error);
    bool wait_for_channel_locked(std::string &error);

    void run_deferred_auto_connect(uint64_t generation);
    AutoConnectReport sweep(const std::vector<driver::DriverDescriptor> &drivers, int port);
};

}  // namespace server
}  // namespace indiweb
