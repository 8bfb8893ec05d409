#include "runtime.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace indiweb {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing INDI Web Manager");

    init_catalog();

    supervisor_ = std::make_unique<server::ServerSupervisor>(config_.server);
    LOG_INFO("[Runtime] Server supervisor created (" << config_.server.executable << ", fifo "
                                                     << config_.server.fifo_path << ")");

    if (!init_profiles(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

void Runtime::init_catalog() {
    catalog_ = std::make_unique<driver::DriverCatalog>();

    auto loaded = catalog_->load(config_.drivers.xml_dir);
    if (!loaded) {
        // An empty catalog still serves remote drivers and custom drivers
        LOG_WARN("[Runtime] Driver directory unreadable: " << config_.drivers.xml_dir);
    } else {
        LOG_INFO("[Runtime] Driver catalog: " << *loaded << " driver(s) in " << catalog_->families().size()
                                              << " families");
    }
}

bool Runtime::init_profiles(std::string &error) {
    std::error_code ec;
    if (!config_.server.config_dir.empty()) {
        std::filesystem::create_directories(config_.server.config_dir, ec);
        if (ec) {
            error = "Cannot create config directory " + config_.server.config_dir + ": " + ec.message();
            return false;
        }
    }

    store_ = std::make_unique<profile::YamlProfileStore>(config_.profiles.path, config_.server.port);
    std::string store_error;
    if (!store_->open(store_error)) {
        error = "Profile store failed to open: " + store_error;
        return false;
    }

    launcher_ = std::make_unique<ProfileLauncher>(*catalog_, *store_, *supervisor_, config_.server.config_dir,
                                                  std::chrono::milliseconds(config_.server.auto_connect_delay_ms));
    launcher_->reload_custom_drivers();

    LOG_INFO("[Runtime] Profiles: " << store_->list_profiles().size() << " in " << store_->path());
    return true;
}

bool Runtime::init_http(std::string &error) {
    LOG_INFO("[Runtime] Creating HTTP server");
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *catalog_, *store_, *supervisor_, *launcher_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << http_server_->get_port());
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    server::SupervisorResult autostart_result;
    if (launcher_->autostart(autostart_result) && !autostart_result.success) {
        LOG_ERROR("[Runtime] Autostart failed: " << autostart_result.error_message);
    }

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (launcher_) {
        launcher_->stop();
    } else if (supervisor_) {
        supervisor_->stop();
    }
}

}  // namespace runtime
}  // namespace indiweb
