#include "../../server/server_supervisor.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace indiweb {
namespace http {

//=============================================================================
// GET /api/devices
//=============================================================================
void HttpServer::handle_get_devices(const httplib::Request &, httplib::Response &res) {
    std::vector<server::DeviceStatus> devices;
    auto result = supervisor_.list_devices(devices);
    if (!result.success) {
        send_supervisor_result(res, result);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"devices", encode_devices(devices)}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace indiweb
