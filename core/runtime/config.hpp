#pragma once

#include <string>
#include <vector>

#include "server/server_config.hpp"

namespace indiweb {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
    std::string file;            // Mirror log lines to this file (empty = stderr only)
};

struct HttpConfig {
    std::string bind = "0.0.0.0";                        // Bind address
    int port = 8624;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
};

struct DriversConfig {
    std::string xml_dir = "/usr/share/indi";  // INDI driver definition files
};

struct ProfilesConfig {
    std::string path;  // Empty = <server.config_dir>/profiles.yaml
};

struct RuntimeConfig {
    HttpConfig http;
    server::ServerConfig server;
    DriversConfig drivers;
    ProfilesConfig profiles;
    LoggingConfig logging;
};

// Defaults that depend on the environment ($HOME)
RuntimeConfig default_config();

// Loads configuration from a YAML file on top of the values already in config
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

// Expand a leading "~" and fill derived paths (profiles.path)
void resolve_paths(RuntimeConfig &config);

std::string expand_home(const std::string &path);

}  // namespace runtime
}  // namespace indiweb
