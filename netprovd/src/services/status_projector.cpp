#include "services/status_projector.hpp"
#include "services/progress_channel.hpp"

#include <algorithm>

namespace netprov
{
    namespace services
    {

        namespace
        {
            const model::Interface *find_link(const std::vector<model::Interface> &links, const std::string &name)
            {
                auto it = std::find_if(links.begin(), links.end(),
                                       [&](const model::Interface &link) { return link.name == name; });
                return it == links.end() ? nullptr : &*it;
            }

            // Link that carries the object: the radio / segment itself, the
            // VLAN link or the bridge device
            template <typename Config>
            std::string carrier(const Config &config)
            {
                return config.key();
            }

            template <typename Config>
            ObjectStatus<Config> project(const Config &config, const std::vector<model::Interface> &links)
            {
                ObjectStatus<Config> status;
                status.config = config;

                for (const auto &name : model::backing_interfaces(config))
                {
                    if (!find_link(links, name))
                    {
                        status.missing_interfaces.push_back(name);
                    }
                }
                status.degraded = !status.missing_interfaces.empty();

                if (const auto *link = find_link(links, carrier(config)))
                {
                    status.live = *link;
                }
                return status;
            }

            template <typename Config>
            std::vector<ObjectStatus<Config>> project_all(const std::vector<Config> &configs,
                                                          const std::vector<model::Interface> &links)
            {
                std::vector<ObjectStatus<Config>> result;
                result.reserve(configs.size());
                for (const auto &config : configs)
                {
                    result.push_back(project(config, links));
                }
                return result;
            }

            template <typename Config>
            void collect_degraded(const std::vector<ObjectStatus<Config>> &statuses, model::ObjectKind kind,
                                  std::vector<std::string> &out)
            {
                for (const auto &status : statuses)
                {
                    if (status.degraded)
                    {
                        out.push_back(model::qualified_key(kind, status.config.key()));
                    }
                }
            }
        }

        StatusProjector::StatusProjector(const db::ConfigStore &store,
                                         const infrastructure::InterfaceSource &interfaces,
                                         const std::string &engine_id, const ProgressChannel *progress)
            : store_(store), interfaces_(interfaces), engine_id_(engine_id), progress_(progress)
        {
        }

        std::vector<model::Interface> StatusProjector::interfaces() const
        {
            return interfaces_.list_interfaces();
        }

        std::vector<model::Interface> StatusProjector::diagnostics() const
        {
            return interfaces_.list_all();
        }

        std::vector<ObjectStatus<model::WirelessConfig>> StatusProjector::wireless() const
        {
            return project_all(store_.list_wireless(), interfaces_.list_all());
        }

        std::vector<ObjectStatus<model::HotspotInstance>> StatusProjector::hotspots() const
        {
            return project_all(store_.list_hotspots(), interfaces_.list_all());
        }

        std::vector<ObjectStatus<model::VlanConfig>> StatusProjector::vlans() const
        {
            return project_all(store_.list_vlans(), interfaces_.list_all());
        }

        std::vector<ObjectStatus<model::BridgeConfig>> StatusProjector::bridges() const
        {
            return project_all(store_.list_bridges(), interfaces_.list_all());
        }

        StatusOverview StatusProjector::overview() const
        {
            auto links = interfaces_.list_interfaces();
            auto state = store_.snapshot();

            StatusOverview overview;
            overview.engine_id = engine_id_;
            overview.interfaces_total = links.size();
            overview.interfaces_up = std::count_if(links.begin(), links.end(),
                                                   [](const model::Interface &link) { return link.is_up(); });

            overview.counts[model::to_string(model::ObjectKind::WIRELESS)] = state.wireless.size();
            overview.counts[model::to_string(model::ObjectKind::HOTSPOT)] = state.hotspots.size();
            overview.counts[model::to_string(model::ObjectKind::VLAN)] = state.vlans.size();
            overview.counts[model::to_string(model::ObjectKind::BRIDGE)] = state.bridges.size();

            // Degradation is judged against every link, loopback included
            auto all_links = interfaces_.list_all();
            collect_degraded(project_all(state.vlans, all_links), model::ObjectKind::VLAN, overview.degraded);
            collect_degraded(project_all(state.bridges, all_links), model::ObjectKind::BRIDGE, overview.degraded);
            collect_degraded(project_all(state.wireless, all_links), model::ObjectKind::WIRELESS, overview.degraded);
            collect_degraded(project_all(state.hotspots, all_links), model::ObjectKind::HOTSPOT, overview.degraded);

            overview.last_event = progress_ ? progress_->last_sequence() : 0;
            return overview;
        }

    } // namespace services
} // namespace netprov
