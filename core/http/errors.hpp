#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "server/supervisor_result.hpp"

namespace indiweb
{
    namespace http
    {

        /**
         * @brief API status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - FAILED_PRECONDITION -> HTTP 409
         * - UNAVAILABLE -> HTTP 503
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            FAILED_PRECONDITION,
            UNAVAILABLE,
            INTERNAL
        };

        /**
         * @brief Convert StatusCode to HTTP status integer
         */
        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::FAILED_PRECONDITION:
                return 409;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        /**
         * @brief Convert StatusCode to string representation
         */
        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::FAILED_PRECONDITION:
                return "FAILED_PRECONDITION";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Map a supervisor outcome onto the API status model
         *
         * ALREADY_RUNNING and NOT_RUNNING are state conflicts (409). A missing
         * FIFO reader or an unreachable client port means the device server
         * cannot be talked to (503).
         */
        inline StatusCode status_from_supervisor(server::SupervisorErrorCode code)
        {
            switch (code)
            {
            case server::SupervisorErrorCode::OK:
                return StatusCode::OK;
            case server::SupervisorErrorCode::NOT_FOUND:
                return StatusCode::NOT_FOUND;
            case server::SupervisorErrorCode::INVALID_ARGUMENT:
                return StatusCode::INVALID_ARGUMENT;
            case server::SupervisorErrorCode::ALREADY_RUNNING:
            case server::SupervisorErrorCode::NOT_RUNNING:
                return StatusCode::FAILED_PRECONDITION;
            case server::SupervisorErrorCode::CHANNEL_UNAVAILABLE:
                return StatusCode::UNAVAILABLE;
            case server::SupervisorErrorCode::START_FAILED:
            default:
                return StatusCode::INTERNAL;
            }
        }

        /**
         * @brief Build a JSON status object
         *
         * All HTTP responses include a top-level "status" object with code and message.
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        /**
         * @brief Build a complete JSON error response
         *
         * Creates a JSON object with just the status field for error responses.
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"status", make_status(code, message)}};
        }

    } // namespace http
} // namespace indiweb
