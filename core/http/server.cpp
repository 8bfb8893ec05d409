#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace indiweb {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
constexpr const char *kAllowedMethods = "GET, POST, PUT, DELETE, OPTIONS";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, driver::DriverCatalog &catalog,
                       profile::IProfileStore &store, server::ServerSupervisor &supervisor,
                       runtime::ProfileLauncher &launcher)
    : config_(config), catalog_(catalog), store_(store), supervisor_(supervisor), launcher_(launcher) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    // Starting a profile blocks a worker for up to the FIFO startup timeout
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string &allowed = *matched;
        const std::string response_origin = allowed == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // JSON body for HTTP errors raised by httplib itself (unknown route etc.)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    if (config_.port == 0) {
        int bound = server_->bind_to_any_port(config_.bind);
        if (bound < 0) {
            error = "Failed to bind to " + config_.bind + " (ephemeral port)";
            return false;
        }
        port_ = bound;
    } else {
        if (!server_->bind_to_port(config_.bind, config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    using Req = httplib::Request;
    using Res = httplib::Response;

    // Profiles. "custom" is registered before the {name} routes so it is not
    // taken for a profile name.
    server_->Get("/api/profiles", [this](const Req &req, Res &res) { handle_get_profiles(req, res); });
    server_->Post("/api/profiles/custom", [this](const Req &req, Res &res) { handle_post_custom_driver(req, res); });
    server_->Get(R"(/api/profiles/([^/]+)/labels)",
                 [this](const Req &req, Res &res) { handle_get_profile_labels(req, res); });
    server_->Get(R"(/api/profiles/([^/]+)/remote)",
                 [this](const Req &req, Res &res) { handle_get_profile_remote(req, res); });
    server_->Post(R"(/api/profiles/([^/]+)/drivers)",
                  [this](const Req &req, Res &res) { handle_post_profile_drivers(req, res); });
    server_->Get(R"(/api/profiles/([^/]+))", [this](const Req &req, Res &res) { handle_get_profile(req, res); });
    server_->Post(R"(/api/profiles/([^/]+))", [this](const Req &req, Res &res) { handle_post_profile(req, res); });
    server_->Put(R"(/api/profiles/([^/]+))", [this](const Req &req, Res &res) { handle_put_profile(req, res); });
    server_->Delete(R"(/api/profiles/([^/]+))",
                    [this](const Req &req, Res &res) { handle_delete_profile(req, res); });

    // Device server
    server_->Get("/api/server/status", [this](const Req &req, Res &res) { handle_get_server_status(req, res); });
    server_->Get("/api/server/drivers", [this](const Req &req, Res &res) { handle_get_server_drivers(req, res); });
    server_->Post(R"(/api/server/start/([^/]+))",
                  [this](const Req &req, Res &res) { handle_post_server_start(req, res); });
    server_->Post("/api/server/stop", [this](const Req &req, Res &res) { handle_post_server_stop(req, res); });
    server_->Post("/api/server/autoconnect",
                  [this](const Req &req, Res &res) { handle_post_server_autoconnect(req, res); });

    // Drivers. Labels may contain '/', so the capture runs to the end.
    server_->Get("/api/drivers", [this](const Req &req, Res &res) { handle_get_drivers(req, res); });
    server_->Get("/api/drivers/groups", [this](const Req &req, Res &res) { handle_get_driver_groups(req, res); });
    server_->Post(R"(/api/drivers/start/(.+))",
                  [this](const Req &req, Res &res) { handle_post_driver_start(req, res); });
    server_->Post(R"(/api/drivers/stop/(.+))", [this](const Req &req, Res &res) { handle_post_driver_stop(req, res); });
    server_->Post(R"(/api/drivers/restart/(.+))",
                  [this](const Req &req, Res &res) { handle_post_driver_restart(req, res); });
    server_->Post(R"(/api/drivers/start_remote/(.+))",
                  [this](const Req &req, Res &res) { handle_post_remote_start(req, res); });
    server_->Post(R"(/api/drivers/stop_remote/(.+))",
                  [this](const Req &req, Res &res) { handle_post_remote_stop(req, res); });

    // Devices published by the running server
    server_->Get("/api/devices", [this](const Req &req, Res &res) { handle_get_devices(req, res); });

    // Host info
    server_->Get("/api/info/version", [this](const Req &req, Res &res) { handle_get_version(req, res); });
    server_->Get("/api/info/arch", [this](const Req &req, Res &res) { handle_get_arch(req, res); });
    server_->Get("/api/info/hostname", [this](const Req &req, Res &res) { handle_get_hostname(req, res); });

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/api/.*)", [](const Req &, Res &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET/POST/PUT/DELETE /api/profiles[/{name}[/labels|/remote|/drivers]]");
    LOG_INFO("[HTTP]   POST /api/profiles/custom");
    LOG_INFO("[HTTP]   GET  /api/server/status, /api/server/drivers");
    LOG_INFO("[HTTP]   POST /api/server/start/{profile}, /api/server/stop, /api/server/autoconnect");
    LOG_INFO("[HTTP]   GET  /api/drivers, /api/drivers/groups");
    LOG_INFO("[HTTP]   POST /api/drivers/{start|stop|restart|start_remote|stop_remote}/{label}");
    LOG_INFO("[HTTP]   GET  /api/devices");
    LOG_INFO("[HTTP]   GET  /api/info/{version|arch|hostname}");
}

}  // namespace http
}  // namespace indiweb
