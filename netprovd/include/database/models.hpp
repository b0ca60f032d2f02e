#pragma once

#include <sqlite_orm/sqlite_orm.h>
#include <string>
#include <cstdint>
#include <chrono>

namespace netprov {
namespace db {

// Wireless access point settings, one row per radio
struct WirelessRow {
    std::string interface;
    std::string ssid;
    std::string password;
    int channel;
    std::string hw_mode;
    std::string bridge;
    std::string config_digest;
    int link_was_up;
    int64_t applied_at;

    WirelessRow() : channel(1), hw_mode("g"), link_was_up(0), applied_at(0) {}
};

// Captive-portal segment, one row per interface
struct HotspotRow {
    std::string interface;
    std::string ip_address;
    std::string dhcp_range;  // "low,high"
    int bandwidth_limit;     // Mbps, 0 = unshaped
    int enabled;
    std::string config_digest;
    int link_was_up;
    int64_t applied_at;

    HotspotRow() : bandwidth_limit(0), enabled(1), link_was_up(0), applied_at(0) {}
};

// 802.1Q sub-interface, keyed by derived name "parent.id"
struct VlanRow {
    std::string name;
    std::string parent;
    int id;
    std::string config_digest;
    int link_was_up;
    int64_t applied_at;

    VlanRow() : id(0), link_was_up(0), applied_at(0) {}
};

// Ethernet bridge; members kept as a JSON array of interface names
struct BridgeRow {
    std::string name;
    std::string members;
    int stp;
    std::string config_digest;
    int link_was_up;
    int64_t applied_at;

    BridgeRow() : members("[]"), stp(0), link_was_up(0), applied_at(0) {}
};

// Define the storage schema using sqlite_orm
inline auto initStorage(const std::string& path) {
    using namespace sqlite_orm;

    return make_storage(
        path,
        make_table(
            "wireless_settings",
            make_column("interface", &WirelessRow::interface, primary_key()),
            make_column("ssid", &WirelessRow::ssid),
            make_column("password", &WirelessRow::password, default_value("")),
            make_column("channel", &WirelessRow::channel, default_value(1)),
            make_column("hw_mode", &WirelessRow::hw_mode, default_value("g")),
            make_column("bridge", &WirelessRow::bridge, default_value("")),
            make_column("config_digest", &WirelessRow::config_digest, default_value("")),
            make_column("link_was_up", &WirelessRow::link_was_up, default_value(0)),
            make_column("applied_at", &WirelessRow::applied_at, default_value(0))
        ),
        make_table(
            "hotspots",
            make_column("interface", &HotspotRow::interface, primary_key()),
            make_column("ip_address", &HotspotRow::ip_address),
            make_column("dhcp_range", &HotspotRow::dhcp_range),
            make_column("bandwidth_limit", &HotspotRow::bandwidth_limit, default_value(0)),
            make_column("enabled", &HotspotRow::enabled, default_value(1)),
            make_column("config_digest", &HotspotRow::config_digest, default_value("")),
            make_column("link_was_up", &HotspotRow::link_was_up, default_value(0)),
            make_column("applied_at", &HotspotRow::applied_at, default_value(0))
        ),
        make_table(
            "vlans",
            make_column("name", &VlanRow::name, primary_key()),
            make_column("parent", &VlanRow::parent),
            make_column("id", &VlanRow::id),
            make_column("config_digest", &VlanRow::config_digest, default_value("")),
            make_column("link_was_up", &VlanRow::link_was_up, default_value(0)),
            make_column("applied_at", &VlanRow::applied_at, default_value(0))
        ),
        make_table(
            "bridges",
            make_column("name", &BridgeRow::name, primary_key()),
            make_column("members", &BridgeRow::members, default_value("[]")),
            make_column("stp", &BridgeRow::stp, default_value(0)),
            make_column("config_digest", &BridgeRow::config_digest, default_value("")),
            make_column("link_was_up", &BridgeRow::link_was_up, default_value(0)),
            make_column("applied_at", &BridgeRow::applied_at, default_value(0))
        )
    );
}

// Define storage type for convenience
using Storage = decltype(initStorage(""));

// Helper function to get current timestamp
inline int64_t getCurrentTimestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace db
} // namespace netprov
