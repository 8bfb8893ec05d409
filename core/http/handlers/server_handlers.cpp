#include "../../logging/logger.hpp"
#include "../../runtime/profile_launcher.hpp"
#include "../../server/server_supervisor.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace indiweb {
namespace http {

//=============================================================================
// GET /api/server/status
//=============================================================================
void HttpServer::handle_get_server_status(const httplib::Request &, httplib::Response &res) {
    // is_running() reaps a dead server, so it goes first
    const bool running = supervisor_.is_running();
    auto session = launcher_.session();
    auto pid = supervisor_.server_pid();
    auto port = supervisor_.port();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"running", running},
                               {"state", server::server_state_to_string(supervisor_.state())},
                               {"auto_connect_pending", supervisor_.auto_connect_pending()}};
    response["active_profile"] =
        running && session.active_profile ? nlohmann::json(*session.active_profile) : nlohmann::json(nullptr);
    response["pid"] = pid ? nlohmann::json(static_cast<int64_t>(*pid)) : nlohmann::json(nullptr);
    response["port"] = port ? nlohmann::json(*port) : nlohmann::json(nullptr);

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /api/server/drivers
//=============================================================================
void HttpServer::handle_get_server_drivers(const httplib::Request &, httplib::Response &res) {
    // Liveness probe first: a dead server must report an empty set
    if (!supervisor_.is_running()) {
        nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"drivers", nlohmann::json::array()}};
        send_json(res, StatusCode::OK, response);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"drivers", encode_running_drivers(supervisor_.running_drivers())}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /api/server/start/{profile}
//=============================================================================
void HttpServer::handle_post_server_start(const httplib::Request &req, httplib::Response &res) {
    std::string profile_name;
    if (!parse_path_param(req, profile_name)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Missing profile name"));
        return;
    }

    auto result = launcher_.start_profile(profile_name);
    if (!result.success) {
        LOG_WARN("[HTTP] Start of profile '" << profile_name << "' failed: " << result.error_message);
    }
    send_supervisor_result(res, result);
}

//=============================================================================
// POST /api/server/stop
//=============================================================================
void HttpServer::handle_post_server_stop(const httplib::Request &, httplib::Response &res) {
    launcher_.stop();
    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}});
}

//=============================================================================
// POST /api/server/autoconnect
//=============================================================================
void HttpServer::handle_post_server_autoconnect(const httplib::Request &, httplib::Response &res) {
    server::AutoConnectReport report;
    auto result = supervisor_.auto_connect(&report);
    if (!result.success) {
        send_supervisor_result(res, result);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"attempted", report.attempted},
                               {"connected", report.connected},
                               {"failures", report.failures}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace indiweb
