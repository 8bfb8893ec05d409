#pragma once

#include <string>
#include <vector>

namespace indiweb {
namespace server {

constexpr int kDefaultIndiPort = 7624;

struct ServerConfig {
    std::string executable = "indiserver";  // Device server binary (PATH lookup if bare)
    int port = kDefaultIndiPort;            // Port given to newly created profiles
    std::string fifo_path = "/tmp/indiFIFO";
    std::string config_dir;                 // INDI config directory (working dir of indiserver)
    std::string log_file;                   // indiserver stdout/stderr, empty = inherit
    int max_queue_mb = 100;                 // indiserver -m
    std::vector<std::string> extra_args;    // Appended after the standard arguments
    int startup_timeout_ms = 5000;          // Bound on waiting for the FIFO reader
    int fifo_retry_ms = 100;                // Fixed backoff between FIFO open attempts
    int shutdown_timeout_ms = 2000;         // SIGTERM grace period before SIGKILL
    int auto_connect_delay_ms = 3000;       // Delay before the deferred CONNECT sweep
    int connect_timeout_ms = 1000;          // Per-driver TCP connect timeout
    std::string connect_host = "localhost";
};

}  // namespace server
}  // namespace indiweb
