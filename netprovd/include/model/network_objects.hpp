#ifndef NETPROV_MODEL_NETWORK_OBJECTS_HPP
#define NETPROV_MODEL_NETWORK_OBJECTS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netprov
{
    namespace model
    {

        /**
         * Link classification reported by interface discovery
         */
        enum class InterfaceType
        {
            ETHERNET,
            WIFI,
            BRIDGE,
            VLAN,
            LOOPBACK
        };

        enum class LinkStatus
        {
            UP,
            DOWN
        };

        /**
         * Kinds of desired-state objects the engine provisions
         */
        enum class ObjectKind
        {
            WIRELESS,
            HOTSPOT,
            VLAN,
            BRIDGE
        };

        std::string to_string(InterfaceType type);
        std::string to_string(LinkStatus status);
        std::string to_string(ObjectKind kind);
        std::optional<ObjectKind> parse_object_kind(const std::string &text);

        /**
         * Live link as seen by the kernel. Never persisted.
         */
        struct Interface
        {
            std::string name;
            InterfaceType type = InterfaceType::ETHERNET;
            LinkStatus status = LinkStatus::DOWN; // operational: carrier, or admin state for virtual links
            bool admin_up = false;                // IFF_UP, what "ip link set up|down" toggles
            std::optional<std::string> ip;
            std::string mac;
            std::optional<std::string> master; // bridge this link is enslaved to

            bool is_up() const { return status == LinkStatus::UP; }
        };

        /**
         * Engine-owned bookkeeping stored next to every applied object
         */
        struct ProvisionMeta
        {
            std::string config_digest;
            bool link_was_up = false;
            int64_t applied_at = 0;
        };

        struct WirelessConfig
        {
            std::string interface;
            std::string ssid;
            std::string password; // empty: open network
            int channel = 1;
            std::string hw_mode = "g";
            std::string bridge; // empty: standalone AP

            ProvisionMeta meta;

            const std::string &key() const { return interface; }
            bool is_open() const { return password.empty(); }
        };

        /**
         * Inclusive DHCP pool, written "low,high" on the wire and in storage
         */
        struct DhcpRange
        {
            std::string low;
            std::string high;

            static std::optional<DhcpRange> parse(const std::string &text);
            std::string to_string() const { return low + "," + high; }
        };

        struct HotspotInstance
        {
            std::string interface;
            std::string ip_address;
            DhcpRange dhcp_range;
            int bandwidth_limit = 0; // Mbps, 0 means unshaped
            bool enabled = true;

            ProvisionMeta meta;

            const std::string &key() const { return interface; }
            bool is_shaped() const { return bandwidth_limit > 0; }
        };

        struct VlanConfig
        {
            int id = 0;
            std::string parent_interface;
            std::string name;

            ProvisionMeta meta;

            const std::string &key() const { return name; }

            static std::string derive_name(const std::string &parent, int id);
        };

        struct BridgeConfig
        {
            std::string name;
            std::vector<std::string> members;
            bool stp = false;

            ProvisionMeta meta;

            const std::string &key() const { return name; }
            bool has_member(const std::string &interface) const;
        };

        /**
         * Point-in-time copy of every stored object, used by validation and
         * dependency checks.
         */
        struct DesiredState
        {
            std::vector<WirelessConfig> wireless;
            std::vector<HotspotInstance> hotspots;
            std::vector<VlanConfig> vlans;
            std::vector<BridgeConfig> bridges;

            const WirelessConfig *find_wireless(const std::string &interface) const;
            const HotspotInstance *find_hotspot(const std::string &interface) const;
            const VlanConfig *find_vlan(const std::string &name) const;
            const BridgeConfig *find_bridge(const std::string &name) const;

            // Stored bridge listing this interface as a member
            const BridgeConfig *bridge_of(const std::string &interface) const;
        };

        /**
         * True when both objects describe the same desired state. Engine
         * bookkeeping in ProvisionMeta is ignored.
         */
        bool same_desired_state(const WirelessConfig &a, const WirelessConfig &b);
        bool same_desired_state(const HotspotInstance &a, const HotspotInstance &b);
        bool same_desired_state(const VlanConfig &a, const VlanConfig &b);
        bool same_desired_state(const BridgeConfig &a, const BridgeConfig &b);

        /**
         * Existing links an object needs in order to be provisioned. An
         * object is degraded while any of them is missing.
         */
        std::vector<std::string> backing_interfaces(const WirelessConfig &config);
        std::vector<std::string> backing_interfaces(const HotspotInstance &hotspot);
        std::vector<std::string> backing_interfaces(const VlanConfig &vlan);
        std::vector<std::string> backing_interfaces(const BridgeConfig &bridge);

        // Sorted, de-duplicated member list
        std::vector<std::string> normalize_members(std::vector<std::string> members);

        // "hotspot:eth0.10"
        std::string qualified_key(ObjectKind kind, const std::string &key);

    } // namespace model
} // namespace netprov

#endif // NETPROV_MODEL_NETWORK_OBJECTS_HPP
