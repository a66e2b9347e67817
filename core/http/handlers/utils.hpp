#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"
#include "../../audit/i_audit_log.hpp"

namespace devauth
{
    namespace http
    {

        // Helper: Parse device_id from regex match
        inline bool parse_path_params(const httplib::Request &req, std::string &device_id)
        {
            if (req.matches.size() >= 2)
            {
                device_id = req.matches[1].str();
                return true;
            }
            return false;
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(), "application/json");
        }

        // Helper: Send error response
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

        // Helper: Parse request body as JSON object
        inline bool parse_json_body(const httplib::Request &req, nlohmann::json &body, std::string &error)
        {
            body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded())
            {
                error = "Invalid JSON body";
                return false;
            }
            if (!body.is_object())
            {
                error = "Request body must be a JSON object";
                return false;
            }
            return true;
        }

        // Helper: Request origin for the audit trail
        inline audit::Provenance provenance_from(const httplib::Request &req)
        {
            audit::Provenance provenance;
            if (!req.remote_addr.empty())
            {
                provenance.ip_address = req.remote_addr;
            }
            if (req.has_header("User-Agent"))
            {
                provenance.user_agent = req.get_header_value("User-Agent");
            }
            return provenance;
        }

    } // namespace http
} // namespace devauth
