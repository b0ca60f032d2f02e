/**
 * Conflict Validator
 * Admission rules evaluated before any external command runs
 */

#include "services/conflict_validator.hpp"
#include "core/errors.hpp"
#include "model/ipv4.hpp"

#include <algorithm>
#include <optional>

namespace netprov
{
    namespace services
    {

        using model::InterfaceType;

        namespace
        {
            constexpr int HOTSPOT_PREFIX = 24;
            constexpr size_t MAX_IFNAME = 15;

            const int FIVE_GHZ_CHANNELS[] = {36, 40, 44, 48, 52, 56, 60, 64, 100, 104, 108, 112, 116,
                                             120, 124, 128, 132, 136, 140, 144, 149, 153, 157, 161, 165};

            const model::Interface *find_link(const std::vector<model::Interface> &links, const std::string &name)
            {
                auto it = std::find_if(links.begin(), links.end(),
                                       [&](const model::Interface &iface) { return iface.name == name; });
                return it == links.end() ? nullptr : &*it;
            }

            // Rendered verbatim into hostapd.conf, one directive per line
            bool has_control_characters(const std::string &value)
            {
                return std::any_of(value.begin(), value.end(), [](char c) {
                    auto byte = static_cast<unsigned char>(c);
                    return byte < 0x20 || byte == 0x7f;
                });
            }
        }

        ValidationResult ValidationResult::conflict(const std::string &reason)
        {
            ValidationResult result;
            result.outcome = Outcome::CONFLICT;
            result.reason = reason;
            return result;
        }

        ValidationResult ValidationResult::interface_missing(const std::string &name)
        {
            ValidationResult result;
            result.outcome = Outcome::INTERFACE_MISSING;
            result.interface = name;
            result.reason = "interface " + name + " does not exist";
            return result;
        }

        bool ConflictValidator::valid_channel(const std::string &hw_mode, int channel)
        {
            if (hw_mode == "g")
            {
                return channel >= 1 && channel <= 14;
            }
            if (hw_mode == "a")
            {
                return std::find(std::begin(FIVE_GHZ_CHANNELS), std::end(FIVE_GHZ_CHANNELS), channel) !=
                       std::end(FIVE_GHZ_CHANNELS);
            }
            return false;
        }

        bool ConflictValidator::valid_interface_name(const std::string &name)
        {
            if (name.empty() || name.size() > MAX_IFNAME || name == "." || name == "..")
            {
                return false;
            }
            return std::none_of(name.begin(), name.end(), [](char c) {
                return c == '/' || c == ':' || c == ' ' || c == '\t' || c == '\n';
            });
        }

        void ConflictValidator::raise_if_rejected(const ValidationResult &result, model::ObjectKind kind,
                                                  const std::string &key)
        {
            switch (result.outcome)
            {
            case ValidationResult::Outcome::OK:
                return;
            case ValidationResult::Outcome::INTERFACE_MISSING:
                throw core::InterfaceNotFound(kind, key, result.interface);
            case ValidationResult::Outcome::CONFLICT:
                throw core::ValidationConflict(kind, key, result.reason);
            }
        }

        ValidationResult ConflictValidator::check(const model::WirelessConfig &config,
                                                  const model::DesiredState &state,
                                                  const std::vector<model::Interface> &links) const
        {
            if (!valid_interface_name(config.interface))
                return ValidationResult::conflict("invalid interface name '" + config.interface + "'");
            if (config.ssid.empty() || config.ssid.size() > 32)
                return ValidationResult::conflict("ssid must be 1-32 bytes");
            if (has_control_characters(config.ssid))
                return ValidationResult::conflict("ssid must not contain control characters");
            if (!config.password.empty() && (config.password.size() < 8 || config.password.size() > 63))
                return ValidationResult::conflict("WPA2 passphrase must be 8-63 characters");
            if (has_control_characters(config.password))
                return ValidationResult::conflict("WPA2 passphrase must not contain control characters");
            if (config.hw_mode != "g" && config.hw_mode != "a")
                return ValidationResult::conflict("hw_mode must be 'g' (2.4 GHz) or 'a' (5 GHz)");
            if (!valid_channel(config.hw_mode, config.channel))
                return ValidationResult::conflict("channel " + std::to_string(config.channel) +
                                                  " is not valid for hw_mode " + config.hw_mode);

            // Rule 1: referenced interfaces
            const auto *link = find_link(links, config.interface);
            if (!link)
                return ValidationResult::interface_missing(config.interface);
            if (link->type != InterfaceType::WIFI)
                return ValidationResult::conflict(config.interface + " is not a wireless interface");

            if (!config.bridge.empty())
            {
                const auto *bridge = state.find_bridge(config.bridge);
                if (!bridge)
                    return ValidationResult::conflict("bridge " + config.bridge + " is not configured");
                if (!bridge->has_member(config.interface))
                    return ValidationResult::conflict("bridge " + config.bridge + " does not list " +
                                                      config.interface + " as a member");
            }
            else
            {
                if (link->master)
                    return ValidationResult::conflict(config.interface + " is enslaved to " + *link->master);
                if (const auto *owner = state.bridge_of(config.interface))
                    return ValidationResult::conflict(config.interface + " is a member of bridge " + owner->name +
                                                      "; set bridge to " + owner->name);
            }

            // Rule 2: one access point per radio
            if (state.find_wireless(config.interface))
                return ValidationResult::conflict("wireless access point already configured on " +
                                                  config.interface);

            return ValidationResult::ok();
        }

        ValidationResult ConflictValidator::check(const model::HotspotInstance &hotspot,
                                                  const model::DesiredState &state,
                                                  const std::vector<model::Interface> &links) const
        {
            if (!valid_interface_name(hotspot.interface))
                return ValidationResult::conflict("invalid interface name '" + hotspot.interface + "'");

            auto gateway = model::Ipv4Address::parse(hotspot.ip_address);
            if (!gateway)
                return ValidationResult::conflict("invalid ip_address '" + hotspot.ip_address + "'");
            auto low = model::Ipv4Address::parse(hotspot.dhcp_range.low);
            auto high = model::Ipv4Address::parse(hotspot.dhcp_range.high);
            if (!low || !high)
                return ValidationResult::conflict("invalid dhcp_range '" + hotspot.dhcp_range.to_string() + "'");
            if (hotspot.bandwidth_limit < 0)
                return ValidationResult::conflict("bandwidth_limit must not be negative");

            // Rule 1
            const auto *link = find_link(links, hotspot.interface);
            if (!link)
                return ValidationResult::interface_missing(hotspot.interface);
            if (link->type == InterfaceType::LOOPBACK)
                return ValidationResult::conflict("cannot run a hotspot on loopback");
            if (link->master)
                return ValidationResult::conflict(hotspot.interface + " is enslaved to " + *link->master);
            if (const auto *owner = state.bridge_of(hotspot.interface))
                return ValidationResult::conflict(hotspot.interface + " is a member of bridge " + owner->name);

            // Rule 2
            if (state.find_hotspot(hotspot.interface))
                return ValidationResult::conflict("hotspot already configured on " + hotspot.interface);

            // Rule 3: addressing
            model::Ipv4Subnet subnet(*gateway, HOTSPOT_PREFIX);
            if (*gateway == subnet.network() || *gateway == subnet.broadcast())
                return ValidationResult::conflict("ip_address " + hotspot.ip_address +
                                                  " is not a usable host address");
            if (!(*low <= *high))
                return ValidationResult::conflict("dhcp_range start is above its end");
            if (!subnet.contains(*low) || !subnet.contains(*high))
                return ValidationResult::conflict("dhcp_range " + hotspot.dhcp_range.to_string() +
                                                  " is outside " + subnet.to_string());
            if (*low <= *gateway && *gateway <= *high)
                return ValidationResult::conflict("gateway " + hotspot.ip_address + " lies inside dhcp_range");

            for (const auto &other : state.hotspots)
            {
                if (other.interface == hotspot.interface)
                    continue;
                auto other_ip = model::Ipv4Address::parse(other.ip_address);
                if (!other_ip)
                    continue;
                model::Ipv4Subnet other_subnet(*other_ip, HOTSPOT_PREFIX);
                if (subnet.overlaps(other_subnet))
                    return ValidationResult::conflict("subnet " + subnet.to_string() +
                                                      " overlaps hotspot on " + other.interface);
            }

            return ValidationResult::ok();
        }

        ValidationResult ConflictValidator::check(const model::VlanConfig &vlan, const model::DesiredState &state,
                                                  const std::vector<model::Interface> &links) const
        {
            if (vlan.id < 2 || vlan.id > 4094)
                return ValidationResult::conflict("VLAN id must be between 2 and 4094");
            if (!valid_interface_name(vlan.parent_interface))
                return ValidationResult::conflict("invalid parent interface '" + vlan.parent_interface + "'");

            auto derived = model::VlanConfig::derive_name(vlan.parent_interface, vlan.id);
            if (vlan.name != derived)
                return ValidationResult::conflict("VLAN name must be " + derived);
            if (!valid_interface_name(derived))
                return ValidationResult::conflict("derived name " + derived + " exceeds the interface name limit");

            // Rule 1
            const auto *parent = find_link(links, vlan.parent_interface);
            if (!parent)
                return ValidationResult::interface_missing(vlan.parent_interface);
            if (parent->type != InterfaceType::ETHERNET && parent->type != InterfaceType::WIFI)
                return ValidationResult::conflict("VLAN parent " + vlan.parent_interface +
                                                  " must be an ethernet or wifi interface");

            // Rule 2
            if (state.find_vlan(derived))
                return ValidationResult::conflict("VLAN " + derived + " already exists");
            const auto *existing = find_link(links, derived);
            if (existing && existing->type != InterfaceType::VLAN)
                return ValidationResult::conflict("a " + model::to_string(existing->type) + " link named " +
                                                  derived + " already exists");

            return ValidationResult::ok();
        }

        ValidationResult ConflictValidator::check(const model::BridgeConfig &bridge, const model::DesiredState &state,
                                                  const std::vector<model::Interface> &links) const
        {
            if (!valid_interface_name(bridge.name))
                return ValidationResult::conflict("invalid bridge name '" + bridge.name + "'");
            if (bridge.members.empty())
                return ValidationResult::conflict("bridge needs at least one member");
            for (const auto &member : bridge.members)
            {
                if (!valid_interface_name(member))
                    return ValidationResult::conflict("invalid member name '" + member + "'");
            }

            // Rule 1
            for (const auto &member : bridge.members)
            {
                if (member == bridge.name)
                    continue;
                const auto *link = find_link(links, member);
                if (!link)
                    return ValidationResult::interface_missing(member);
                if (link->type == InterfaceType::LOOPBACK)
                    return ValidationResult::conflict("cannot enslave loopback " + member);
            }

            // Rule 2
            if (state.find_bridge(bridge.name))
                return ValidationResult::conflict("bridge " + bridge.name + " already exists");
            const auto *existing = find_link(links, bridge.name);
            if (existing && existing->type != InterfaceType::BRIDGE)
                return ValidationResult::conflict("a " + model::to_string(existing->type) + " link named " +
                                                  bridge.name + " already exists");

            // Rule 4: membership
            for (const auto &member : bridge.members)
            {
                if (member == bridge.name)
                    return ValidationResult::conflict("bridge " + bridge.name + " cannot contain itself");
                if (state.find_bridge(member))
                    return ValidationResult::conflict("member " + member + " is itself a bridge");
                if (const auto *owner = state.bridge_of(member))
                    return ValidationResult::conflict(member + " is already enslaved to bridge " + owner->name);

                const auto *link = find_link(links, member);
                if (link && link->master && *link->master != bridge.name)
                    return ValidationResult::conflict(member + " is already enslaved to " + *link->master);

                if (state.find_hotspot(member))
                    return ValidationResult::conflict(member + " hosts a hotspot");
                const auto *ap = state.find_wireless(member);
                if (ap && ap->bridge != bridge.name)
                    return ValidationResult::conflict(member + " hosts a standalone wireless access point");
            }

            return ValidationResult::ok();
        }

    } // namespace services
} // namespace netprov
