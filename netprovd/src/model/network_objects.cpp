#include "model/network_objects.hpp"

#include <algorithm>

namespace netprov
{
    namespace model
    {

        std::string to_string(InterfaceType type)
        {
            switch (type)
            {
            case InterfaceType::ETHERNET:
                return "ethernet";
            case InterfaceType::WIFI:
                return "wifi";
            case InterfaceType::BRIDGE:
                return "bridge";
            case InterfaceType::VLAN:
                return "vlan";
            case InterfaceType::LOOPBACK:
                return "loopback";
            }
            return "ethernet";
        }

        std::string to_string(LinkStatus status)
        {
            return status == LinkStatus::UP ? "up" : "down";
        }

        std::string to_string(ObjectKind kind)
        {
            switch (kind)
            {
            case ObjectKind::WIRELESS:
                return "wireless";
            case ObjectKind::HOTSPOT:
                return "hotspot";
            case ObjectKind::VLAN:
                return "vlan";
            case ObjectKind::BRIDGE:
                return "bridge";
            }
            return "unknown";
        }

        std::optional<ObjectKind> parse_object_kind(const std::string &text)
        {
            if (text == "wireless")
                return ObjectKind::WIRELESS;
            if (text == "hotspot")
                return ObjectKind::HOTSPOT;
            if (text == "vlan")
                return ObjectKind::VLAN;
            if (text == "bridge")
                return ObjectKind::BRIDGE;
            return std::nullopt;
        }

        std::optional<DhcpRange> DhcpRange::parse(const std::string &text)
        {
            auto comma = text.find(',');
            if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos)
            {
                return std::nullopt;
            }

            auto trim = [](std::string s) {
                auto first = s.find_first_not_of(" \t");
                auto last = s.find_last_not_of(" \t");
                if (first == std::string::npos)
                {
                    return std::string();
                }
                return s.substr(first, last - first + 1);
            };

            DhcpRange range{trim(text.substr(0, comma)), trim(text.substr(comma + 1))};
            if (range.low.empty() || range.high.empty())
            {
                return std::nullopt;
            }
            return range;
        }

        std::string VlanConfig::derive_name(const std::string &parent, int id)
        {
            return parent + "." + std::to_string(id);
        }

        bool BridgeConfig::has_member(const std::string &interface) const
        {
            return std::find(members.begin(), members.end(), interface) != members.end();
        }

        namespace
        {
            template <typename T, typename Pred>
            const T *find_in(const std::vector<T> &items, Pred pred)
            {
                auto it = std::find_if(items.begin(), items.end(), pred);
                return it == items.end() ? nullptr : &*it;
            }
        }

        const WirelessConfig *DesiredState::find_wireless(const std::string &interface) const
        {
            return find_in(wireless, [&](const WirelessConfig &w) { return w.interface == interface; });
        }

        const HotspotInstance *DesiredState::find_hotspot(const std::string &interface) const
        {
            return find_in(hotspots, [&](const HotspotInstance &h) { return h.interface == interface; });
        }

        const VlanConfig *DesiredState::find_vlan(const std::string &name) const
        {
            return find_in(vlans, [&](const VlanConfig &v) { return v.name == name; });
        }

        const BridgeConfig *DesiredState::find_bridge(const std::string &name) const
        {
            return find_in(bridges, [&](const BridgeConfig &b) { return b.name == name; });
        }

        const BridgeConfig *DesiredState::bridge_of(const std::string &interface) const
        {
            return find_in(bridges, [&](const BridgeConfig &b) { return b.has_member(interface); });
        }

        bool same_desired_state(const WirelessConfig &a, const WirelessConfig &b)
        {
            return a.interface == b.interface && a.ssid == b.ssid && a.password == b.password &&
                   a.channel == b.channel && a.hw_mode == b.hw_mode && a.bridge == b.bridge;
        }

        bool same_desired_state(const HotspotInstance &a, const HotspotInstance &b)
        {
            return a.interface == b.interface && a.ip_address == b.ip_address &&
                   a.dhcp_range.low == b.dhcp_range.low && a.dhcp_range.high == b.dhcp_range.high &&
                   a.bandwidth_limit == b.bandwidth_limit && a.enabled == b.enabled;
        }

        bool same_desired_state(const VlanConfig &a, const VlanConfig &b)
        {
            return a.id == b.id && a.parent_interface == b.parent_interface && a.name == b.name;
        }

        bool same_desired_state(const BridgeConfig &a, const BridgeConfig &b)
        {
            return a.name == b.name && a.stp == b.stp &&
                   normalize_members(a.members) == normalize_members(b.members);
        }

        std::vector<std::string> backing_interfaces(const WirelessConfig &config)
        {
            return {config.interface};
        }

        std::vector<std::string> backing_interfaces(const HotspotInstance &hotspot)
        {
            return {hotspot.interface};
        }

        std::vector<std::string> backing_interfaces(const VlanConfig &vlan)
        {
            return {vlan.parent_interface};
        }

        std::vector<std::string> backing_interfaces(const BridgeConfig &bridge)
        {
            return normalize_members(bridge.members);
        }

        std::vector<std::string> normalize_members(std::vector<std::string> members)
        {
            std::sort(members.begin(), members.end());
            members.erase(std::unique(members.begin(), members.end()), members.end());
            return members;
        }

        std::string qualified_key(ObjectKind kind, const std::string &key)
        {
            return to_string(kind) + ":" + key;
        }

    } // namespace model
} // namespace netprov
