#include <sys/utsname.h>

#include "../server.hpp"
#include "utils.hpp"

#ifndef INDIWEB_VERSION
#define INDIWEB_VERSION "0.0.0"
#endif

namespace indiweb {
namespace http {

namespace {
bool read_uname(struct utsname &info, httplib::Response &res) {
    if (uname(&info) != 0) {
        send_json(res, StatusCode::INTERNAL, make_error_response(StatusCode::INTERNAL, "uname() failed"));
        return false;
    }
    return true;
}
}  // namespace

//=============================================================================
// GET /api/info/version
//=============================================================================
void HttpServer::handle_get_version(const httplib::Request &, httplib::Response &res) {
    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"version", INDIWEB_VERSION}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /api/info/arch
//=============================================================================
void HttpServer::handle_get_arch(const httplib::Request &, httplib::Response &res) {
    struct utsname info {};
    if (!read_uname(info, res)) {
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"arch", std::string(info.machine)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /api/info/hostname
//=============================================================================
void HttpServer::handle_get_hostname(const httplib::Request &, httplib::Response &res) {
    struct utsname info {};
    if (!read_uname(info, res)) {
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"hostname", std::string(info.nodename)}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace indiweb
