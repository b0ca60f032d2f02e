/**
 * netprovd
 * Network provisioning engine daemon
 */

#include <atomic>
#include <iostream>
#include <csignal>
#include <unistd.h>
#include <memory>
#include <string>
#include <thread>
#include <chrono>

#include "core/config.hpp"
#include "core/engine.hpp"
#include "core/logger.hpp"
#include "api/server.hpp"

// Command line argument parsing
#include <getopt.h>

namespace netprov {

/**
 * Global engine instance for signal handling
 */
std::unique_ptr<core::ProvisioningEngine> g_engine;

/**
 * Global API server instance
 */
std::unique_ptr<ApiServer> g_apiServer;

/**
 * Set by the signal handler, acted on by the main loop
 */
std::atomic<int> g_shutdown_signal{0};

/**
 * Signal handler for graceful shutdown. Only records the signal: running
 * operations must finish or roll back before the process exits.
 */
void signal_handler(int signum) {
    g_shutdown_signal = signum;
}

/**
 * Stop accepting requests, then let in-flight operations finish
 */
void shutdown_gracefully() {
    auto logger = core::get_logger("main");
    logger->info("Received signal, shutting down gracefully...",
                core::LogContext().add("signal", g_shutdown_signal.load()));

    if (g_apiServer) {
        g_apiServer->stop();
    }

    if (g_engine) {
        g_engine->stop();
    }
}

/**
 * Setup signal handlers
 */
void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGQUIT, signal_handler);
}

/**
 * Check if running with required privileges
 */
bool check_root_privileges() {
    if (geteuid() != 0) {
        std::cerr << "ERROR: netprovd must be run as root to configure links, hostapd and dnsmasq." << std::endl;
        std::cerr << "Please run with: sudo ./netprovd" << std::endl;
        return false;
    }
    return true;
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "Network Provisioning Engine\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: netprov_config.json)\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
    std::cout << "  -D, --no-root-check      Skip the root privilege check (for development)\n";
    std::cout << "  -n, --no-api             Run recovery only, without the HTTP API\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "                          # Run with default config\n";
    std::cout << "  " << program_name << " -c /etc/netprov.json     # Use custom configuration\n";
    std::cout << "  " << program_name << " -vv                      # Debug logging\n";
    std::cout << "  " << program_name << " --no-api                 # Re-apply stored state and exit\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "netprovd v1.0.0" << std::endl;
    std::cout << "Built for Linux (iproute2, hostapd, dnsmasq, iptables, tc)" << std::endl;
    std::cout << "Features: Access points, captive portal hotspots, VLANs, bridges" << std::endl;
}

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file = "netprov_config.json";
    int verbosity = 0;
    std::string log_file;
    bool no_root_check = false;
    bool no_api = false;
    bool help = false;
    bool version = false;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",        required_argument, 0, 'c'},
        {"verbose",       no_argument,       0, 'v'},
        {"log-file",      required_argument, 0, 'l'},
        {"no-root-check", no_argument,       0, 'D'},
        {"no-api",        no_argument,       0, 'n'},
        {"help",          no_argument,       0, 'h'},
        {"version",       no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:Dnh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'D':
                args.no_root_check = true;
                break;
            case 'n':
                args.no_api = true;
                break;
            case 'h':
                args.help = true;
                break;
            case 0:
                if (option_index == 6) { // --version
                    args.version = true;
                }
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    return args;
}

/**
 * Command line flags win over the configuration file
 */
void apply_logging(const core::EngineConfig& config, const Arguments& args) {
    core::LogLevel log_level = core::LoggerManager::string_to_level(config.logging.log_level);
    if (args.verbosity == 1) {
        log_level = core::LogLevel::INFO;
    } else if (args.verbosity >= 2) {
        log_level = core::LogLevel::DEBUG;
    }

    std::string log_file = args.log_file.empty() ? config.logging.log_file : args.log_file;
    core::setup_logging(log_level, log_file, log_file.empty());
}

} // namespace netprov

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace netprov;

    try {
        // Parse command line arguments
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        // Bootstrap logging until the configuration is known
        core::LogLevel log_level = core::LogLevel::WARNING;
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }
        core::setup_logging(log_level, args.log_file, args.log_file.empty());
        auto logger = core::get_logger("main");

        // Load configuration
        std::unique_ptr<core::EngineConfig> config;
        try {
            config = core::EngineConfig::from_file(args.config_file);
        } catch (const std::exception& e) {
            logger->error("Failed to load configuration",
                         core::LogContext().add("config_file", args.config_file)
                                          .add("error", e.what()));
            return 1;
        }

        // Apply command-line overrides
        if (args.no_root_check) {
            config->development.skip_root_check = true;
            logger->info("Skipping root privilege check (development mode)");
        }

        if (args.no_api) {
            config->api.enabled = false;
        }

        // Validate configuration
        auto problem = config->validation_error();
        if (!problem.empty()) {
            logger->error("Configuration validation failed", core::LogContext().add("reason", problem));
            return 1;
        }

        apply_logging(*config, args);

        // Check privileges
        if (!config->development.skip_root_check && !check_root_privileges()) {
            return 1;
        }

        // Setup signal handlers
        setup_signal_handlers();

        bool api_enabled = config->api.enabled;
        std::string api_host = config->api.host;
        auto api_port = static_cast<uint16_t>(config->api.port);

        logger->info("Starting netprovd...",
                     core::LogContext().add("engine_id", config->engine_id).add("config_file", args.config_file));

        g_engine = std::make_unique<core::ProvisioningEngine>(std::move(config));

        if (!g_engine->start()) {
            logger->error("Failed to start provisioning engine");
            return 1;
        }

        if (!api_enabled) {
            logger->info("HTTP API disabled, exiting after recovery");
            g_engine->stop();
            return 0;
        }

        // Start HTTP API server
        logger->info("Starting HTTP API server...");
        g_apiServer = std::make_unique<ApiServer>(
            g_engine->get_reconciler(),
            g_engine->get_status_projector(),
            g_engine->get_progress_channel()
        );
        g_apiServer->start(api_host, api_port);

        logger->info("netprovd started successfully");

        // Keep main thread alive
        while (g_engine->is_running() && g_shutdown_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        shutdown_gracefully();
        logger->info("netprovd stopped");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
