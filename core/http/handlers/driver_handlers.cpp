#include "../../driver/driver_catalog.hpp"
#include "../../logging/logger.hpp"
#include "../../server/server_supervisor.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace indiweb {
namespace http {

namespace {
enum class DriverAction { START, STOP, RESTART };

const char *action_name(DriverAction action) {
    switch (action) {
        case DriverAction::START:
            return "start";
        case DriverAction::STOP:
            return "stop";
        case DriverAction::RESTART:
            return "restart";
        default:
            return "unknown";
    }
}

server::SupervisorResult apply(server::ServerSupervisor &supervisor, DriverAction action,
                               const driver::DriverDescriptor &descriptor) {
    switch (action) {
        case DriverAction::START:
            return supervisor.start_driver(descriptor);
        case DriverAction::STOP:
            return supervisor.stop_driver(descriptor);
        case DriverAction::RESTART:
        default:
            return supervisor.restart_driver(descriptor);
    }
}

void handle_label_action(const httplib::Request &req, httplib::Response &res, driver::DriverCatalog &catalog,
                         server::ServerSupervisor &supervisor, DriverAction action) {
    std::string label;
    if (!parse_path_param(req, label)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, "Missing label"));
        return;
    }

    auto descriptor = catalog.by_label(label);
    if (!descriptor) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(StatusCode::NOT_FOUND, "Driver not found: " + label));
        return;
    }

    auto result = apply(supervisor, action, *descriptor);
    if (!result.success) {
        LOG_WARN("[HTTP] Driver " << action_name(action) << " '" << label << "' failed: " << result.error_message);
    }
    send_supervisor_result(res, result);
}

void handle_remote_action(const httplib::Request &req, httplib::Response &res, server::ServerSupervisor &supervisor,
                          DriverAction action) {
    std::string endpoint;
    if (!parse_path_param(req, endpoint)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Missing remote endpoint"));
        return;
    }

    auto descriptor = driver::make_remote_descriptor(endpoint);
    if (!descriptor.is_remote()) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Remote endpoint must be device@host[:port]"));
        return;
    }

    auto result = apply(supervisor, action, descriptor);
    if (!result.success) {
        LOG_WARN("[HTTP] Remote " << action_name(action) << " '" << endpoint << "' failed: " << result.error_message);
    }
    send_supervisor_result(res, result);
}
}  // namespace

//=============================================================================
// GET /api/drivers
//=============================================================================
void HttpServer::handle_get_drivers(const httplib::Request &, httplib::Response &res) {
    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"drivers", encode_drivers(catalog_.all_drivers())}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /api/drivers/groups
//=============================================================================
void HttpServer::handle_get_driver_groups(const httplib::Request &, httplib::Response &res) {
    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"groups", catalog_.families()}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /api/drivers/{start|stop|restart}/{label}
//=============================================================================
void HttpServer::handle_post_driver_start(const httplib::Request &req, httplib::Response &res) {
    handle_label_action(req, res, catalog_, supervisor_, DriverAction::START);
}

void HttpServer::handle_post_driver_stop(const httplib::Request &req, httplib::Response &res) {
    handle_label_action(req, res, catalog_, supervisor_, DriverAction::STOP);
}

void HttpServer::handle_post_driver_restart(const httplib::Request &req, httplib::Response &res) {
    handle_label_action(req, res, catalog_, supervisor_, DriverAction::RESTART);
}

//=============================================================================
// POST /api/drivers/{start_remote|stop_remote}/{device@host[:port]}
//=============================================================================
void HttpServer::handle_post_remote_start(const httplib::Request &req, httplib::Response &res) {
    handle_remote_action(req, res, supervisor_, DriverAction::START);
}

void HttpServer::handle_post_remote_stop(const httplib::Request &req, httplib::Response &res) {
    handle_remote_action(req, res, supervisor_, DriverAction::STOP);
}

}  // namespace http
}  // namespace indiweb
