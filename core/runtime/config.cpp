#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "logging/logger.hpp"

namespace indiweb {
namespace runtime {

std::string expand_home(const std::string &path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;  // ~user is not supported
    }
    const char *home = std::getenv("HOME");
    if (home == nullptr) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

RuntimeConfig default_config() {
    RuntimeConfig config;
    config.server.config_dir = expand_home("~/.indi");
    return config;
}

void resolve_paths(RuntimeConfig &config) {
    config.server.config_dir = expand_home(config.server.config_dir);
    config.server.log_file = expand_home(config.server.log_file);
    config.drivers.xml_dir = expand_home(config.drivers.xml_dir);
    config.logging.file = expand_home(config.logging.file);

    if (config.profiles.path.empty()) {
        std::string dir = config.server.config_dir;
        if (!dir.empty() && dir.back() != '/') {
            dir += '/';
        }
        config.profiles.path = dir + "profiles.yaml";
    } else {
        config.profiles.path = expand_home(config.profiles.path);
    }
}

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Validate device server settings
    const auto &server = config.server;
    if (server.executable.empty()) {
        error = "server.executable must not be empty";
        return false;
    }
    if (server.port < 1 || server.port > 65535) {
        error = "INDI server port must be between 1 and 65535";
        return false;
    }
    if (server.port == config.http.port) {
        error = "INDI server port and HTTP port must differ";
        return false;
    }
    if (server.fifo_path.empty()) {
        error = "server.fifo must not be empty";
        return false;
    }
    if (server.max_queue_mb < 1) {
        error = "server.max_queue_mb must be >= 1";
        return false;
    }
    if (server.startup_timeout_ms < 100) {
        error = "server.startup_timeout_ms must be >= 100ms";
        return false;
    }
    if (server.fifo_retry_ms < 1 || server.fifo_retry_ms > server.startup_timeout_ms) {
        error = "server.fifo_retry_ms must be between 1 and startup_timeout_ms";
        return false;
    }
    if (server.shutdown_timeout_ms < 0 || server.shutdown_timeout_ms > 30000) {
        error = "server.shutdown_timeout_ms must be between 0 and 30000ms";
        return false;
    }
    if (server.auto_connect_delay_ms < 0) {
        error = "server.auto_connect_delay_ms must be >= 0";
        return false;
    }
    if (server.connect_timeout_ms < 1) {
        error = "server.connect_timeout_ms must be >= 1ms";
        return false;
    }

    if (config.drivers.xml_dir.empty()) {
        error = "drivers.xml_dir must not be empty";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "server", "drivers", "profiles", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load device server config
        if (yaml["server"]) {
            const auto &node = yaml["server"];
            auto &server = config.server;
            if (node["executable"]) {
                server.executable = node["executable"].as<std::string>();
            }
            if (node["port"]) {
                server.port = node["port"].as<int>();
            }
            if (node["fifo"]) {
                server.fifo_path = node["fifo"].as<std::string>();
            }
            if (node["config_dir"]) {
                server.config_dir = node["config_dir"].as<std::string>();
            }
            if (node["log_file"]) {
                server.log_file = node["log_file"].as<std::string>();
            }
            if (node["max_queue_mb"]) {
                server.max_queue_mb = node["max_queue_mb"].as<int>();
            }
            if (node["extra_args"]) {
                server.extra_args.clear();
                for (const auto &arg : node["extra_args"]) {
                    server.extra_args.push_back(arg.as<std::string>());
                }
            }
            if (node["startup_timeout_ms"]) {
                server.startup_timeout_ms = node["startup_timeout_ms"].as<int>();
            }
            if (node["fifo_retry_ms"]) {
                server.fifo_retry_ms = node["fifo_retry_ms"].as<int>();
            }
            if (node["shutdown_timeout_ms"]) {
                server.shutdown_timeout_ms = node["shutdown_timeout_ms"].as<int>();
            }
            if (node["auto_connect_delay_ms"]) {
                server.auto_connect_delay_ms = node["auto_connect_delay_ms"].as<int>();
            }
            if (node["connect_timeout_ms"]) {
                server.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
            }
            if (node["connect_host"]) {
                server.connect_host = node["connect_host"].as<std::string>();
            }
        }

        if (yaml["drivers"] && yaml["drivers"]["xml_dir"]) {
            config.drivers.xml_dir = yaml["drivers"]["xml_dir"].as<std::string>();
        }

        if (yaml["profiles"] && yaml["profiles"]["path"]) {
            config.profiles.path = yaml["profiles"]["path"].as<std::string>();
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
            if (yaml["logging"]["file"]) {
                config.logging.file = yaml["logging"]["file"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << config.http.bind << ":" << config.http.port;
        LOG_INFO(http_msg.str());
        LOG_INFO("[Config] INDI server: " << config.server.executable << " (port " << config.server.port
                                          << ", fifo " << config.server.fifo_path << ")");
        LOG_INFO("[Config] Driver definitions: " << config.drivers.xml_dir);
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace indiweb
