#ifndef NETPROV_CORE_CONFIG_HPP
#define NETPROV_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace netprov
{
    namespace core
    {

        /**
         * Filesystem locations owned by the engine
         */
        struct PathsConfig
        {
            std::string state_db = "/var/lib/netprov/state.db";
            std::string hostapd_dir = "/etc/hostapd";
            std::string dnsmasq_dir = "/etc/netprov/dnsmasq"; // private: the stock service reads /etc/dnsmasq.d
            std::string staging_dir = "/var/lib/netprov/staging";
            std::string run_dir = "/run/netprov";
            std::string lease_dir = "/var/lib/netprov/leases";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Bounds on external commands. Every command gets command_seconds,
         * the whole Activating phase of one object gets activation_seconds.
         */
        struct TimeoutsConfig
        {
            int command_seconds = 20;
            int activation_seconds = 60;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Captive portal segment defaults
         */
        struct HotspotDefaults
        {
            int portal_port = 80;
            std::string lease_time = "12h";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * HTTP adapter configuration
         */
        struct ApiConfig
        {
            bool enabled = true;
            std::string host = "0.0.0.0";
            int port = 8090;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Progress channel retention
         */
        struct EventsConfig
        {
            int retained = 256;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Development and testing configuration
         */
        struct DevelopmentConfig
        {
            bool skip_root_check = false;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete engine configuration
         */
        class EngineConfig
        {
        public:
            std::string engine_id = "netprov";

            PathsConfig paths;
            TimeoutsConfig timeouts;
            HotspotDefaults hotspot;
            ApiConfig api;
            EventsConfig events;
            LoggingConfig logging;
            DevelopmentConfig development;

        public:
            EngineConfig() = default;

            // Factory methods
            static std::unique_ptr<EngineConfig> from_file(const std::string &config_path);
            static std::unique_ptr<EngineConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<EngineConfig> create_default();

            // Serialization
            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            /**
             * Returns an empty string when valid, else the first problem found.
             */
            std::string validation_error() const;
            bool validate() const { return validation_error().empty(); }
        };

    } // namespace core
} // namespace netprov

#endif // NETPROV_CORE_CONFIG_HPP
