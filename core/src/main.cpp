// INDI Web Manager
// Config-based runtime with CLI argument parsing

#include <iostream>
#include <optional>
#include <string>
#include <filesystem>
#include "runtime/runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

namespace
{
    struct CliOverrides
    {
        std::optional<int> indi_port;
        std::optional<int> http_port;
        std::optional<std::string> host;
        std::optional<std::string> fifo;
        std::optional<std::string> conf_dir;
        std::optional<std::string> xml_dir;
        std::optional<std::string> log_file;
        bool verbose = false;
    };

    void print_usage()
    {
        std::cerr << "Usage: indiweb [OPTIONS]\n\n";
        std::cerr << "Options:\n";
        std::cerr << "  --config=PATH         YAML config file (optional)\n";
        std::cerr << "  -p, --indi-port=N     Default INDI server port (7624)\n";
        std::cerr << "  -P, --port=N          HTTP port (8624)\n";
        std::cerr << "  -H, --host=ADDR       HTTP bind address (0.0.0.0)\n";
        std::cerr << "  -f, --fifo=PATH       INDI server control FIFO (/tmp/indiFIFO)\n";
        std::cerr << "  -c, --conf=DIR        INDI config directory (~/.indi)\n";
        std::cerr << "  -x, --xmldir=DIR      INDI driver definitions (/usr/share/indi)\n";
        std::cerr << "  -l, --logfile=PATH    Mirror the log to a file\n";
        std::cerr << "  -v, --verbose         Debug logging\n";
        std::cerr << "  -h, --help            Show this help\n";
    }

    // Matches "--long=value", "--long value" or "-s value". Advances i past a
    // separate value argument.
    bool take_value(int argc, char **argv, int &i, const std::string &long_name, const std::string &short_name,
                    std::string &value, bool &missing)
    {
        std::string arg = argv[i];
        const std::string long_prefix = long_name + "=";
        if (arg.compare(0, long_prefix.size(), long_prefix) == 0)
        {
            value = arg.substr(long_prefix.size());
            return true;
        }
        if (arg == long_name || (!short_name.empty() && arg == short_name))
        {
            if (i + 1 >= argc)
            {
                missing = true;
                return true;
            }
            value = argv[++i];
            return true;
        }
        return false;
    }

    bool parse_port(const std::string &text, int &port)
    {
        try
        {
            size_t pos = 0;
            port = std::stoi(text, &pos);
            return pos == text.size();
        }
        catch (const std::exception &)
        {
            return false;
        }
    }
} // namespace

int main(int argc, char **argv)
{
    std::optional<std::string> config_path;
    CliOverrides cli;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::string value;
        bool missing = false;

        if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            cli.verbose = true;
            continue;
        }
        else if (take_value(argc, argv, i, "--config", "", value, missing))
        {
            config_path = value;
        }
        else if (take_value(argc, argv, i, "--indi-port", "-p", value, missing))
        {
            int port = 0;
            if (!missing && !parse_port(value, port))
            {
                std::cerr << "Invalid INDI port: " << value << "\n";
                return 1;
            }
            cli.indi_port = port;
        }
        else if (take_value(argc, argv, i, "--port", "-P", value, missing))
        {
            int port = 0;
            if (!missing && !parse_port(value, port))
            {
                std::cerr << "Invalid HTTP port: " << value << "\n";
                return 1;
            }
            cli.http_port = port;
        }
        else if (take_value(argc, argv, i, "--host", "-H", value, missing))
        {
            cli.host = value;
        }
        else if (take_value(argc, argv, i, "--fifo", "-f", value, missing))
        {
            cli.fifo = value;
        }
        else if (take_value(argc, argv, i, "--conf", "-c", value, missing))
        {
            cli.conf_dir = value;
        }
        else if (take_value(argc, argv, i, "--xmldir", "-x", value, missing))
        {
            cli.xml_dir = value;
        }
        else if (take_value(argc, argv, i, "--logfile", "-l", value, missing))
        {
            cli.log_file = value;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }

        if (missing)
        {
            std::cerr << "Missing value for " << arg << "\n";
            return 1;
        }
    }

    indiweb::runtime::RuntimeConfig config = indiweb::runtime::default_config();
    std::string error;

    if (config_path)
    {
        if (!std::filesystem::exists(*config_path))
        {
            // Using cerr here as logger might not be initialized/configured
            std::cerr << "ERROR: Config file not found: " << *config_path << "\n";
            return 1;
        }

        LOG_INFO("Loading config: " << *config_path);
        if (!indiweb::runtime::load_config(*config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    // Command line wins over the file
    if (cli.indi_port)
        config.server.port = *cli.indi_port;
    if (cli.http_port)
        config.http.port = *cli.http_port;
    if (cli.host)
        config.http.bind = *cli.host;
    if (cli.fifo)
        config.server.fifo_path = *cli.fifo;
    if (cli.conf_dir)
        config.server.config_dir = *cli.conf_dir;
    if (cli.xml_dir)
        config.drivers.xml_dir = *cli.xml_dir;
    if (cli.log_file)
        config.logging.file = *cli.log_file;
    if (cli.verbose)
        config.logging.level = "debug";

    indiweb::runtime::resolve_paths(config);

    if (!indiweb::runtime::validate_config(config, error))
    {
        LOG_ERROR("Invalid configuration: " << error);
        return 1;
    }

    indiweb::logging::Logger::set_level(indiweb::logging::string_to_level(config.logging.level));
    if (!config.logging.file.empty() && !indiweb::logging::Logger::set_file(config.logging.file))
    {
        LOG_WARN("Cannot open log file " << config.logging.file << ", logging to stderr only");
    }

    LOG_INFO("INDI Web Manager " << INDIWEB_VERSION << " starting...");

    // Installed before any child process or socket exists
    indiweb::runtime::SignalHandler::install();

    indiweb::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Drivers: " << runtime.get_catalog().size());
    LOG_INFO("  INDI port: " << config.server.port);

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    indiweb::logging::Logger::close_file();
    LOG_INFO("Shutdown complete");
    return 0;
}
