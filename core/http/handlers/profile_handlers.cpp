#include "../../driver/driver_catalog.hpp"
#include "../../logging/logger.hpp"
#include "../../profile/profile_store.hpp"
#include "../../runtime/profile_launcher.hpp"
#include "../../server/control_channel.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace indiweb {
namespace http {

//=============================================================================
// GET /api/profiles
//=============================================================================
void HttpServer::handle_get_profiles(const httplib::Request &, httplib::Response &res) {
    nlohmann::json profiles_json = nlohmann::json::array();
    for (const auto &profile : store_.list_profiles()) {
        profiles_json.push_back(encode_profile(profile));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"profiles", profiles_json}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /api/profiles/{name}
//=============================================================================
void HttpServer::handle_get_profile(const httplib::Request &req, httplib::Response &res) {
    std::string name;
    if (!parse_path_param(req, name)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, "Missing name"));
        return;
    }

    auto profile = store_.get_profile(name);
    if (!profile) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(StatusCode::NOT_FOUND, "Profile not found: " + name));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"profile", encode_profile(*profile)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /api/profiles/{name}
//=============================================================================
void HttpServer::handle_post_profile(const httplib::Request &req, httplib::Response &res) {
    std::string name;
    if (!parse_path_param(req, name)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, "Missing name"));
        return;
    }

    if (store_.get_profile(name)) {
        send_json(res, StatusCode::FAILED_PRECONDITION,
                  make_error_response(StatusCode::FAILED_PRECONDITION, "Profile already exists: " + name));
        return;
    }

    std::string error;
    if (!store_.add_profile(name, error)) {
        send_json(res, StatusCode::INTERNAL, make_error_response(StatusCode::INTERNAL, error));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"profile", name}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// DELETE /api/profiles/{name}
//=============================================================================
void HttpServer::handle_delete_profile(const httplib::Request &req, httplib::Response &res) {
    std::string name;
    if (!parse_path_param(req, name)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, "Missing name"));
        return;
    }

    if (!store_.get_profile(name)) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(StatusCode::NOT_FOUND, "Profile not found: " + name));
        return;
    }

    std::string error;
    if (!store_.delete_profile(name, error)) {
        send_json(res, StatusCode::INTERNAL, make_error_response(StatusCode::INTERNAL, error));
        return;
    }

    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}});
}

//=============================================================================
// PUT /api/profiles/{name}
//=============================================================================
void HttpServer::handle_put_profile(const httplib::Request &req, httplib::Response &res) {
    std::string name;
    if (!parse_path_param(req, name)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, "Missing name"));
        return;
    }

    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    auto profile = store_.get_profile(name);
    if (!profile) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(StatusCode::NOT_FOUND, "Profile not found: " + name));
        return;
    }

    std::string error;
    if (!decode_profile_update(body, *profile, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    if (!store_.update_profile(*profile, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"profile", encode_profile(*profile)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /api/profiles/{name}/drivers
//=============================================================================
void HttpServer::handle_post_profile_drivers(const httplib::Request &req, httplib::Response &res) {
    std::string name;
    if (!parse_path_param(req, name)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, "Missing name"));
        return;
    }

    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    std::vector<std::string> labels;
    std::optional<std::string> remote;
    std::string error;
    if (!decode_profile_drivers(body, labels, remote, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    for (const auto &label : labels) {
        if (!catalog_.by_label(label)) {
            send_json(res, StatusCode::NOT_FOUND,
                      make_error_response(StatusCode::NOT_FOUND, "Driver not found: " + label));
            return;
        }
    }

    if (!store_.save_profile_drivers(name, labels, remote, error)) {
        send_json(res, StatusCode::INTERNAL, make_error_response(StatusCode::INTERNAL, error));
        return;
    }

    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}});
}

//=============================================================================
// POST /api/profiles/custom
//=============================================================================
void HttpServer::handle_post_custom_driver(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    driver::DriverDescriptor descriptor;
    std::string error;
    if (!decode_custom_driver(body, descriptor, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }
    // Refuse drivers that could never be started
    if (!server::ControlChannel::format_start(descriptor, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    if (!store_.save_custom_driver(descriptor, error)) {
        send_json(res, StatusCode::INTERNAL, make_error_response(StatusCode::INTERNAL, error));
        return;
    }

    launcher_.reload_custom_drivers();
    LOG_INFO("[HTTP] Custom driver '" << descriptor.label << "' saved");

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"driver", encode_driver(descriptor)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /api/profiles/{name}/labels
//=============================================================================
void HttpServer::handle_get_profile_labels(const httplib::Request &req, httplib::Response &res) {
    std::string name;
    if (!parse_path_param(req, name)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, "Missing name"));
        return;
    }

    if (!store_.get_profile(name)) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(StatusCode::NOT_FOUND, "Profile not found: " + name));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"labels", store_.get_profile_driver_labels(name)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /api/profiles/{name}/remote
//=============================================================================
void HttpServer::handle_get_profile_remote(const httplib::Request &req, httplib::Response &res) {
    std::string name;
    if (!parse_path_param(req, name)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, "Missing name"));
        return;
    }

    if (!store_.get_profile(name)) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(StatusCode::NOT_FOUND, "Profile not found: " + name));
        return;
    }

    auto remote = store_.get_profile_remote_drivers(name);
    nlohmann::json response = {{"status", make_status(StatusCode::OK)}};
    response["remote"] = remote ? nlohmann::json(*remote) : nlohmann::json(nullptr);
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace indiweb
