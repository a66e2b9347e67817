#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace devauth
{
    namespace http
    {

        /**
         * @brief API status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200, CREATED -> HTTP 201
         * - INVALID_ARGUMENT -> HTTP 400
         * - UNAUTHENTICATED, INVALID_CODE, REPLAY_DETECTED -> HTTP 401
         * - PERMISSION_DENIED -> HTTP 403 (device inactive)
         * - NOT_FOUND -> HTTP 404
         * - ALREADY_EXISTS, FAILED_PRECONDITION -> HTTP 409
         * - RESOURCE_EXHAUSTED -> HTTP 429
         * - INTERNAL -> HTTP 500
         * - UNAVAILABLE -> HTTP 503
         * - DEADLINE_EXCEEDED -> HTTP 504
         *
         * INVALID_CODE and REPLAY_DETECTED share an HTTP status but keep
         * distinct codes in the body.
         */
        enum class StatusCode
        {
            OK,
            CREATED,
            INVALID_ARGUMENT,
            UNAUTHENTICATED,
            INVALID_CODE,
            REPLAY_DETECTED,
            PERMISSION_DENIED,
            NOT_FOUND,
            ALREADY_EXISTS,
            FAILED_PRECONDITION,
            RESOURCE_EXHAUSTED,
            INTERNAL,
            UNAVAILABLE,
            DEADLINE_EXCEEDED
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
            case StatusCode::CREATED:
                return 201;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::UNAUTHENTICATED:
            case StatusCode::INVALID_CODE:
            case StatusCode::REPLAY_DETECTED:
                return 401;
            case StatusCode::PERMISSION_DENIED:
                return 403;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::ALREADY_EXISTS:
            case StatusCode::FAILED_PRECONDITION:
                return 409;
            case StatusCode::RESOURCE_EXHAUSTED:
                return 429;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::DEADLINE_EXCEEDED:
                return 504;
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
            case StatusCode::CREATED:
                return "CREATED";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::UNAUTHENTICATED:
                return "UNAUTHENTICATED";
            case StatusCode::INVALID_CODE:
                return "INVALID_CODE";
            case StatusCode::REPLAY_DETECTED:
                return "REPLAY_DETECTED";
            case StatusCode::PERMISSION_DENIED:
                return "PERMISSION_DENIED";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::ALREADY_EXISTS:
                return "ALREADY_EXISTS";
            case StatusCode::FAILED_PRECONDITION:
                return "FAILED_PRECONDITION";
            case StatusCode::RESOURCE_EXHAUSTED:
                return "RESOURCE_EXHAUSTED";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::DEADLINE_EXCEEDED:
                return "DEADLINE_EXCEEDED";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Build a JSON status object
         *
         * All HTTP responses include a top-level "status" object with code and message.
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            const bool success = code == StatusCode::OK || code == StatusCode::CREATED;
            std::string msg = message.empty() ? (success ? "ok" : status_code_to_string(code)) : message;
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
} // namespace devauth
