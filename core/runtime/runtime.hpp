#pragma once

#include <atomic>
#include <memory>

#include "config.hpp"
#include "driver/driver_catalog.hpp"
#include "http/server.hpp"
#include "profile/yaml_profile_store.hpp"
#include "profile_launcher.hpp"
#include "server/server_supervisor.hpp"

namespace indiweb {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Initialize all components (catalog, profiles, supervisor, HTTP)
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Stop HTTP and the device server
    void shutdown();

    const driver::DriverCatalog &get_catalog() const { return *catalog_; }

private:
    // Staged initialization helpers
    void init_catalog();
    bool init_profiles(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<driver::DriverCatalog> catalog_;
    std::unique_ptr<profile::YamlProfileStore> store_;
    std::unique_ptr<server::ServerSupervisor> supervisor_;
    std::unique_ptr<ProfileLauncher> launcher_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace indiweb
