#pragma once

/**
 * @brief HTTP Route Handlers
 *
 * All route handlers are defined as methods on HttpServer, one source file
 * per resource under handlers/.
 *
 * Endpoints:
 * - GET    /api/profiles                          -> handle_get_profiles
 * - GET    /api/profiles/{name}                   -> handle_get_profile
 * - POST   /api/profiles/{name}                   -> handle_post_profile
 * - PUT    /api/profiles/{name}                   -> handle_put_profile
 * - DELETE /api/profiles/{name}                   -> handle_delete_profile
 * - GET    /api/profiles/{name}/labels            -> handle_get_profile_labels
 * - GET    /api/profiles/{name}/remote            -> handle_get_profile_remote
 * - POST   /api/profiles/{name}/drivers           -> handle_post_profile_drivers
 * - POST   /api/profiles/custom                   -> handle_post_custom_driver
 * - GET    /api/server/status                     -> handle_get_server_status
 * - GET    /api/server/drivers                    -> handle_get_server_drivers
 * - POST   /api/server/start/{profile}            -> handle_post_server_start
 * - POST   /api/server/stop                       -> handle_post_server_stop
 * - POST   /api/server/autoconnect                -> handle_post_server_autoconnect
 * - GET    /api/drivers                           -> handle_get_drivers
 * - GET    /api/drivers/groups                    -> handle_get_driver_groups
 * - POST   /api/drivers/{start|stop|restart}/{label}
 * - POST   /api/drivers/{start_remote|stop_remote}/{device@host[:port]}
 * - GET    /api/devices                           -> handle_get_devices
 * - GET    /api/info/{version|arch|hostname}
 *
 * All responses use JSON and include a top-level "status" object.
 */

// Handler implementations are part of HttpServer class in server.hpp
// This header exists for documentation only.
