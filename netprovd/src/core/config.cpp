#include "core/config.hpp"
#include <fstream>
#include <stdexcept>

namespace netprov
{
    namespace core
    {

        void PathsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("state_db"))
                state_db = j["state_db"];
            if (j.contains("hostapd_dir"))
                hostapd_dir = j["hostapd_dir"];
            if (j.contains("dnsmasq_dir"))
                dnsmasq_dir = j["dnsmasq_dir"];
            if (j.contains("staging_dir"))
                staging_dir = j["staging_dir"];
            if (j.contains("run_dir"))
                run_dir = j["run_dir"];
            if (j.contains("lease_dir"))
                lease_dir = j["lease_dir"];
        }

        nlohmann::json PathsConfig::to_json() const
        {
            return nlohmann::json{
                {"state_db", state_db},
                {"hostapd_dir", hostapd_dir},
                {"dnsmasq_dir", dnsmasq_dir},
                {"staging_dir", staging_dir},
                {"run_dir", run_dir},
                {"lease_dir", lease_dir}};
        }

        void TimeoutsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("command_seconds"))
                command_seconds = j["command_seconds"];
            if (j.contains("activation_seconds"))
                activation_seconds = j["activation_seconds"];
        }

        nlohmann::json TimeoutsConfig::to_json() const
        {
            return nlohmann::json{
                {"command_seconds", command_seconds},
                {"activation_seconds", activation_seconds}};
        }

        void HotspotDefaults::from_json(const nlohmann::json &j)
        {
            if (j.contains("portal_port"))
                portal_port = j["portal_port"];
            if (j.contains("lease_time"))
                lease_time = j["lease_time"];
        }

        nlohmann::json HotspotDefaults::to_json() const
        {
            return nlohmann::json{
                {"portal_port", portal_port},
                {"lease_time", lease_time}};
        }

        void ApiConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("enabled"))
                enabled = j["enabled"];
            if (j.contains("host"))
                host = j["host"];
            if (j.contains("port"))
                port = j["port"];
        }

        nlohmann::json ApiConfig::to_json() const
        {
            return nlohmann::json{
                {"enabled", enabled},
                {"host", host},
                {"port", port}};
        }

        void EventsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("retained"))
                retained = j["retained"];
        }

        nlohmann::json EventsConfig::to_json() const
        {
            return nlohmann::json{{"retained", retained}};
        }

        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"];
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        void DevelopmentConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("skip_root_check"))
                skip_root_check = j["skip_root_check"];
        }

        nlohmann::json DevelopmentConfig::to_json() const
        {
            return nlohmann::json{{"skip_root_check", skip_root_check}};
        }

        std::unique_ptr<EngineConfig> EngineConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<EngineConfig> EngineConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("configuration root must be a JSON object");
            }

            auto config = std::make_unique<EngineConfig>();

            try
            {
                if (j.contains("engine_id"))
                    config->engine_id = j["engine_id"];
                if (j.contains("paths"))
                    config->paths.from_json(j["paths"]);
                if (j.contains("timeouts"))
                    config->timeouts.from_json(j["timeouts"]);
                if (j.contains("hotspot"))
                    config->hotspot.from_json(j["hotspot"]);
                if (j.contains("api"))
                    config->api.from_json(j["api"]);
                if (j.contains("events"))
                    config->events.from_json(j["events"]);
                if (j.contains("logging"))
                    config->logging.from_json(j["logging"]);
                if (j.contains("development"))
                    config->development.from_json(j["development"]);
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument("Wrong value type in configuration: " + std::string(e.what()));
            }

            return config;
        }

        std::unique_ptr<EngineConfig> EngineConfig::create_default()
        {
            return std::make_unique<EngineConfig>();
        }

        nlohmann::json EngineConfig::to_json() const
        {
            return nlohmann::json{
                {"engine_id", engine_id},
                {"paths", paths.to_json()},
                {"timeouts", timeouts.to_json()},
                {"hotspot", hotspot.to_json()},
                {"api", api.to_json()},
                {"events", events.to_json()},
                {"logging", logging.to_json()},
                {"development", development.to_json()}};
        }

        void EngineConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        std::string EngineConfig::validation_error() const
        {
            if (engine_id.empty())
            {
                return "engine_id cannot be empty";
            }

            if (paths.state_db.empty() || paths.hostapd_dir.empty() || paths.dnsmasq_dir.empty() ||
                paths.staging_dir.empty() || paths.run_dir.empty() || paths.lease_dir.empty())
            {
                return "paths.* entries cannot be empty";
            }

            if (timeouts.command_seconds < 10 || timeouts.command_seconds > 30)
            {
                return "timeouts.command_seconds must be between 10 and 30";
            }

            if (timeouts.activation_seconds < timeouts.command_seconds)
            {
                return "timeouts.activation_seconds must not be shorter than timeouts.command_seconds";
            }

            if (hotspot.portal_port < 1 || hotspot.portal_port > 65535)
            {
                return "hotspot.portal_port must be between 1 and 65535";
            }

            if (hotspot.lease_time.empty())
            {
                return "hotspot.lease_time cannot be empty";
            }

            if (api.port < 1 || api.port > 65535)
            {
                return "api.port must be between 1 and 65535";
            }

            if (events.retained <= 0)
            {
                return "events.retained must be positive";
            }

            return "";
        }

    } // namespace core
} // namespace netprov
