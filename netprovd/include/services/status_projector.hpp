#ifndef NETPROV_SERVICES_STATUS_PROJECTOR_HPP
#define NETPROV_SERVICES_STATUS_PROJECTOR_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "database/config_store.hpp"
#include "infrastructure/interface_discovery.hpp"
#include "model/network_objects.hpp"

namespace netprov
{
    namespace services
    {
        class ProgressChannel;
    }
}

namespace netprov
{
    namespace services
    {

        /**
         * A stored object paired with the live link that carries it
         */
        template <typename Config>
        struct ObjectStatus
        {
            Config config;
            std::optional<model::Interface> live; // absent when the link is gone
            bool degraded = false;
            std::vector<std::string> missing_interfaces;
        };

        struct StatusOverview
        {
            std::string engine_id;
            size_t interfaces_total = 0;
            size_t interfaces_up = 0;
            std::map<std::string, size_t> counts; // per object kind
            std::vector<std::string> degraded;    // qualified keys
            uint64_t last_event = 0;
        };

        /**
         * Read models for the console. Every call does one fresh pass over the
         * store and the live links; nothing is cached.
         */
        class StatusProjector
        {
        public:
            StatusProjector(const db::ConfigStore &store, const infrastructure::InterfaceSource &interfaces,
                            const std::string &engine_id, const ProgressChannel *progress = nullptr);

            std::vector<model::Interface> interfaces() const;
            std::vector<model::Interface> diagnostics() const; // loopback included

            std::vector<ObjectStatus<model::WirelessConfig>> wireless() const;
            std::vector<ObjectStatus<model::HotspotInstance>> hotspots() const;
            std::vector<ObjectStatus<model::VlanConfig>> vlans() const;
            std::vector<ObjectStatus<model::BridgeConfig>> bridges() const;

            StatusOverview overview() const;

        private:
            const db::ConfigStore &store_;
            const infrastructure::InterfaceSource &interfaces_;
            std::string engine_id_;
            const ProgressChannel *progress_;
        };

    } // namespace services
} // namespace netprov

#endif // NETPROV_SERVICES_STATUS_PROJECTOR_HPP
