#pragma once

/**
 * @brief HTTP Route Handlers
 *
 * All route handlers are defined as methods on HttpServer.
 * Implementation is split across handlers/{system,device,otp}_handlers.cpp.
 *
 * Endpoints:
 * - GET  /                                     -> handle_get_root
 * - GET  /health                               -> handle_get_health
 * - POST /api/v1/devices/register              -> handle_post_register
 * - POST /api/v1/otp/verify                    -> handle_post_verify
 * - POST /api/v1/devices/{device_id}/deactivate -> handle_post_deactivate
 * - GET  /api/v1/devices/{device_id}           -> handle_get_device
 * - GET  /api/v1/devices/{device_id}/audit     -> handle_get_device_audit
 * - POST /api/v1/test/generate-otp (debug)     -> handle_post_generate_otp
 *
 * /api/v1 routes require "Authorization: Bearer <api_key>".
 * All responses use JSON and include a top-level "status" object.
 */

// Handler implementations are part of HttpServer class in server.hpp/server.cpp
// This header exists for documentation and potential future refactoring.
