#pragma once

#include <memory>
#include <thread>
#include <atomic>
#include <string>
#include <httplib.h>
#include "runtime/config.hpp"

// Forward declarations
namespace indiweb {
namespace driver { class DriverCatalog; }
namespace profile { class IProfileStore; }
namespace server { class ServerSupervisor; }
namespace runtime { class ProfileLauncher; }
}

namespace indiweb {
namespace http {

/**
 * @brief HTTP server wrapper for the INDI web manager
 *
 * The HTTP server is an external adapter layer that exposes profiles,
 * the driver catalog and the device server supervisor over REST endpoints
 * under /api. It owns no state of its own and delegates every operation.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Catalog, store, supervisor and launcher are all thread-safe
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig& config,
               driver::DriverCatalog& catalog,
               profile::IProfileStore& store,
               server::ServerSupervisor& supervisor,
               runtime::ProfileLauncher& launcher);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     * A configured port of 0 binds an ephemeral port (see get_port()).
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string& error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    driver::DriverCatalog& catalog_;
    profile::IProfileStore& store_;
    server::ServerSupervisor& supervisor_;
    runtime::ProfileLauncher& launcher_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Profiles (profile_handlers.cpp)
    void handle_get_profiles(const httplib::Request& req, httplib::Response& res);
    void handle_get_profile(const httplib::Request& req, httplib::Response& res);
    void handle_post_profile(const httplib::Request& req, httplib::Response& res);
    void handle_delete_profile(const httplib::Request& req, httplib::Response& res);
    void handle_put_profile(const httplib::Request& req, httplib::Response& res);
    void handle_post_profile_drivers(const httplib::Request& req, httplib::Response& res);
    void handle_post_custom_driver(const httplib::Request& req, httplib::Response& res);
    void handle_get_profile_labels(const httplib::Request& req, httplib::Response& res);
    void handle_get_profile_remote(const httplib::Request& req, httplib::Response& res);

    // Device server (server_handlers.cpp)
    void handle_get_server_status(const httplib::Request& req, httplib::Response& res);
    void handle_get_server_drivers(const httplib::Request& req, httplib::Response& res);
    void handle_post_server_start(const httplib::Request& req, httplib::Response& res);
    void handle_post_server_stop(const httplib::Request& req, httplib::Response& res);
    void handle_post_server_autoconnect(const httplib::Request& req, httplib::Response& res);

    // Drivers (driver_handlers.cpp)
    void handle_get_drivers(const httplib::Request& req, httplib::Response& res);
    void handle_get_driver_groups(const httplib::Request& req, httplib::Response& res);
    void handle_post_driver_start(const httplib::Request& req, httplib::Response& res);
    void handle_post_driver_stop(const httplib::Request& req, httplib::Response& res);
    void handle_post_driver_restart(const httplib::Request& req, httplib::Response& res);
    void handle_post_remote_start(const httplib::Request& req, httplib::Response& res);
    void handle_post_remote_stop(const httplib::Request& req, httplib::Response& res);

    // Devices (device_handlers.cpp)
    void handle_get_devices(const httplib::Request& req, httplib::Response& res);

    // Host info (info_handlers.cpp)
    void handle_get_version(const httplib::Request& req, httplib::Response& res);
    void handle_get_arch(const httplib::Request& req, httplib::Response& res);
    void handle_get_hostname(const httplib::Request& req, httplib::Response& res);
};

} // namespace http
} // namespace indiweb
