#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace indiweb
{
    namespace http
    {

        // Helper: First regex capture of the route (profile name, label, endpoint)
        inline bool parse_path_param(const httplib::Request &req, std::string &value)
        {
            if (req.matches.size() >= 2)
            {
                value = req.matches[1].str();
                return !value.empty();
            }
            return false;
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(), "application/json");
        }

        // Helper: Send a status-only response for a supervisor outcome
        inline void send_supervisor_result(httplib::Response &res, const server::SupervisorResult &result)
        {
            StatusCode code = status_from_supervisor(result.code);
            if (result.success)
            {
                send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}});
                return;
            }
            send_json(res, code, make_error_response(code, result.error_message));
        }

        // Helper: Parse a JSON request body, answering 400 on failure
        inline bool parse_json_body(const httplib::Request &req, httplib::Response &res, nlohmann::json &body)
        {
            try
            {
                body = nlohmann::json::parse(req.body.empty() ? std::string("{}") : req.body);
            }
            catch (const std::exception &e)
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what()));
                return false;
            }
            if (!body.is_object())
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, "Request body must be a JSON object"));
                return false;
            }
            return true;
        }

    } // namespace http
} // namespace indiweb
