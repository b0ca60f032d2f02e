#include "database/config_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace netprov {
namespace db {

using model::ObjectKind;

namespace {

WirelessRow to_row(const model::WirelessConfig& config) {
    WirelessRow row;
    row.interface = config.interface;
    row.ssid = config.ssid;
    row.password = config.password;
    row.channel = config.channel;
    row.hw_mode = config.hw_mode;
    row.bridge = config.bridge;
    row.config_digest = config.meta.config_digest;
    row.link_was_up = config.meta.link_was_up ? 1 : 0;
    row.applied_at = config.meta.applied_at;
    return row;
}

model::WirelessConfig from_row(const WirelessRow& row) {
    model::WirelessConfig config;
    config.interface = row.interface;
    config.ssid = row.ssid;
    config.password = row.password;
    config.channel = row.channel;
    config.hw_mode = row.hw_mode;
    config.bridge = row.bridge;
    config.meta.config_digest = row.config_digest;
    config.meta.link_was_up = row.link_was_up != 0;
    config.meta.applied_at = row.applied_at;
    return config;
}

HotspotRow to_row(const model::HotspotInstance& hotspot) {
    HotspotRow row;
    row.interface = hotspot.interface;
    row.ip_address = hotspot.ip_address;
    row.dhcp_range = hotspot.dhcp_range.to_string();
    row.bandwidth_limit = hotspot.bandwidth_limit;
    row.enabled = hotspot.enabled ? 1 : 0;
    row.config_digest = hotspot.meta.config_digest;
    row.link_was_up = hotspot.meta.link_was_up ? 1 : 0;
    row.applied_at = hotspot.meta.applied_at;
    return row;
}

model::HotspotInstance from_row(const HotspotRow& row) {
    model::HotspotInstance hotspot;
    hotspot.interface = row.interface;
    hotspot.ip_address = row.ip_address;
    auto range = model::DhcpRange::parse(row.dhcp_range);
    if (!range) {
        throw core::StoreFailure(ObjectKind::HOTSPOT, row.interface,
                                 "corrupt dhcp_range column: '" + row.dhcp_range + "'");
    }
    hotspot.dhcp_range = *range;
    hotspot.bandwidth_limit = row.bandwidth_limit;
    hotspot.enabled = row.enabled != 0;
    hotspot.meta.config_digest = row.config_digest;
    hotspot.meta.link_was_up = row.link_was_up != 0;
    hotspot.meta.applied_at = row.applied_at;
    return hotspot;
}

VlanRow to_row(const model::VlanConfig& vlan) {
    VlanRow row;
    row.name = vlan.name;
    row.parent = vlan.parent_interface;
    row.id = vlan.id;
    row.config_digest = vlan.meta.config_digest;
    row.link_was_up = vlan.meta.link_was_up ? 1 : 0;
    row.applied_at = vlan.meta.applied_at;
    return row;
}

model::VlanConfig from_row(const VlanRow& row) {
    model::VlanConfig vlan;
    vlan.name = row.name;
    vlan.parent_interface = row.parent;
    vlan.id = row.id;
    vlan.meta.config_digest = row.config_digest;
    vlan.meta.link_was_up = row.link_was_up != 0;
    vlan.meta.applied_at = row.applied_at;
    return vlan;
}

BridgeRow to_row(const model::BridgeConfig& bridge) {
    BridgeRow row;
    row.name = bridge.name;
    row.members = nlohmann::json(bridge.members).dump();
    row.stp = bridge.stp ? 1 : 0;
    row.config_digest = bridge.meta.config_digest;
    row.link_was_up = bridge.meta.link_was_up ? 1 : 0;
    row.applied_at = bridge.meta.applied_at;
    return row;
}

model::BridgeConfig from_row(const BridgeRow& row) {
    model::BridgeConfig bridge;
    bridge.name = row.name;
    try {
        bridge.members = nlohmann::json::parse(row.members).get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
        throw core::StoreFailure(ObjectKind::BRIDGE, row.name,
                                 std::string("corrupt members column: ") + e.what());
    }
    bridge.stp = row.stp != 0;
    bridge.meta.config_digest = row.config_digest;
    bridge.meta.link_was_up = row.link_was_up != 0;
    bridge.meta.applied_at = row.applied_at;
    return bridge;
}

// Runs fn and rethrows anything but a StoreFailure as one
template <typename Fn>
auto store_call(ObjectKind kind, const std::string& key, Fn fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const core::StoreFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw core::StoreFailure(kind, key, e.what());
    }
}

} // namespace

ConfigStore::ConfigStore(const std::string& db_path)
    : path_(db_path), logger_(core::get_logger("ConfigStore")) {
    store_call(ObjectKind::WIRELESS, "", [&] {
        if (db_path != ":memory:") {
            auto parent = std::filesystem::path(db_path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
        }

        storage_ = std::make_shared<Storage>(initStorage(db_path));
        storage_->open_forever();

        // Sync schema (create tables if they don't exist)
        storage_->sync_schema();
    });

    logger_->info("Config store opened", core::LogContext().add("path", db_path));
}

std::shared_ptr<std::mutex> ConfigStore::key_lock(ObjectKind kind, const std::string& key) {
    std::lock_guard<std::mutex> lock(key_locks_mutex_);
    auto& slot = key_locks_[model::qualified_key(kind, key)];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

std::optional<model::WirelessConfig> ConfigStore::get_wireless(const std::string& interface) const {
    return store_call(ObjectKind::WIRELESS, interface, [&]() -> std::optional<model::WirelessConfig> {
        std::lock_guard<std::mutex> lock(storage_mutex_);
        auto row = storage_->get_pointer<WirelessRow>(interface);
        if (!row) {
            return std::nullopt;
        }
        return from_row(*row);
    });
}

std::optional<model::HotspotInstance> ConfigStore::get_hotspot(const std::string& interface) const {
    return store_call(ObjectKind::HOTSPOT, interface, [&]() -> std::optional<model::HotspotInstance> {
        std::lock_guard<std::mutex> lock(storage_mutex_);
        auto row = storage_->get_pointer<HotspotRow>(interface);
        if (!row) {
            return std::nullopt;
        }
        return from_row(*row);
    });
}

std::optional<model::VlanConfig> ConfigStore::get_vlan(const std::string& name) const {
    return store_call(ObjectKind::VLAN, name, [&]() -> std::optional<model::VlanConfig> {
        std::lock_guard<std::mutex> lock(storage_mutex_);
        auto row = storage_->get_pointer<VlanRow>(name);
        if (!row) {
            return std::nullopt;
        }
        return from_row(*row);
    });
}

std::optional<model::BridgeConfig> ConfigStore::get_bridge(const std::string& name) const {
    return store_call(ObjectKind::BRIDGE, name, [&]() -> std::optional<model::BridgeConfig> {
        std::lock_guard<std::mutex> lock(storage_mutex_);
        auto row = storage_->get_pointer<BridgeRow>(name);
        if (!row) {
            return std::nullopt;
        }
        return from_row(*row);
    });
}

bool ConfigStore::contains(ObjectKind kind, const std::string& key) const {
    switch (kind) {
        case ObjectKind::WIRELESS:
            return get_wireless(key).has_value();
        case ObjectKind::HOTSPOT:
            return get_hotspot(key).has_value();
        case ObjectKind::VLAN:
            return get_vlan(key).has_value();
        case ObjectKind::BRIDGE:
            return get_bridge(key).has_value();
    }
    return false;
}

void ConfigStore::put(const model::WirelessConfig& config) {
    auto guard = key_lock(ObjectKind::WIRELESS, config.key());
    std::lock_guard<std::mutex> key_guard(*guard);

    store_call(ObjectKind::WIRELESS, config.key(), [&] {
        auto row = to_row(config);
        std::lock_guard<std::mutex> lock(storage_mutex_);
        storage_->transaction([&] {
            storage_->replace(row);
            return true;
        });
    });

    logger_->debug("Stored wireless config", core::LogContext().add("interface", config.interface));
}

void ConfigStore::put(const model::HotspotInstance& hotspot) {
    auto guard = key_lock(ObjectKind::HOTSPOT, hotspot.key());
    std::lock_guard<std::mutex> key_guard(*guard);

    store_call(ObjectKind::HOTSPOT, hotspot.key(), [&] {
        auto row = to_row(hotspot);
        std::lock_guard<std::mutex> lock(storage_mutex_);
        storage_->transaction([&] {
            storage_->replace(row);
            return true;
        });
    });

    logger_->debug("Stored hotspot", core::LogContext().add("interface", hotspot.interface));
}

void ConfigStore::put(const model::VlanConfig& vlan) {
    auto guard = key_lock(ObjectKind::VLAN, vlan.key());
    std::lock_guard<std::mutex> key_guard(*guard);

    store_call(ObjectKind::VLAN, vlan.key(), [&] {
        auto row = to_row(vlan);
        std::lock_guard<std::mutex> lock(storage_mutex_);
        storage_->transaction([&] {
            storage_->replace(row);
            return true;
        });
    });

    logger_->debug("Stored VLAN", core::LogContext().add("name", vlan.name));
}

void ConfigStore::put(const model::BridgeConfig& bridge) {
    auto guard = key_lock(ObjectKind::BRIDGE, bridge.key());
    std::lock_guard<std::mutex> key_guard(*guard);

    store_call(ObjectKind::BRIDGE, bridge.key(), [&] {
        auto row = to_row(bridge);
        std::lock_guard<std::mutex> lock(storage_mutex_);
        storage_->transaction([&] {
            storage_->replace(row);
            return true;
        });
    });

    logger_->debug("Stored bridge", core::LogContext().add("name", bridge.name).add("members", bridge.members));
}

bool ConfigStore::remove(ObjectKind kind, const std::string& key) {
    auto guard = key_lock(kind, key);
    std::lock_guard<std::mutex> key_guard(*guard);

    bool existed = store_call(kind, key, [&] {
        std::lock_guard<std::mutex> lock(storage_mutex_);
        bool found = false;
        storage_->transaction([&] {
            switch (kind) {
                case ObjectKind::WIRELESS:
                    found = storage_->get_pointer<WirelessRow>(key) != nullptr;
                    if (found) storage_->remove<WirelessRow>(key);
                    break;
                case ObjectKind::HOTSPOT:
                    found = storage_->get_pointer<HotspotRow>(key) != nullptr;
                    if (found) storage_->remove<HotspotRow>(key);
                    break;
                case ObjectKind::VLAN:
                    found = storage_->get_pointer<VlanRow>(key) != nullptr;
                    if (found) storage_->remove<VlanRow>(key);
                    break;
                case ObjectKind::BRIDGE:
                    found = storage_->get_pointer<BridgeRow>(key) != nullptr;
                    if (found) storage_->remove<BridgeRow>(key);
                    break;
            }
            return true;
        });
        return found;
    });

    logger_->debug("Removed stored object",
                   core::LogContext().add("object", model::qualified_key(kind, key)).add("existed", existed));
    return existed;
}

std::vector<model::WirelessConfig> ConfigStore::list_wireless() const {
    return store_call(ObjectKind::WIRELESS, "", [&] {
        using namespace sqlite_orm;
        std::lock_guard<std::mutex> lock(storage_mutex_);
        std::vector<model::WirelessConfig> result;
        for (auto& row : storage_->get_all<WirelessRow>(order_by(&WirelessRow::interface))) {
            result.push_back(from_row(row));
        }
        return result;
    });
}

std::vector<model::HotspotInstance> ConfigStore::list_hotspots() const {
    return store_call(ObjectKind::HOTSPOT, "", [&] {
        using namespace sqlite_orm;
        std::lock_guard<std::mutex> lock(storage_mutex_);
        std::vector<model::HotspotInstance> result;
        for (auto& row : storage_->get_all<HotspotRow>(order_by(&HotspotRow::interface))) {
            result.push_back(from_row(row));
        }
        return result;
    });
}

std::vector<model::VlanConfig> ConfigStore::list_vlans() const {
    return store_call(ObjectKind::VLAN, "", [&] {
        using namespace sqlite_orm;
        std::lock_guard<std::mutex> lock(storage_mutex_);
        std::vector<model::VlanConfig> result;
        for (auto& row : storage_->get_all<VlanRow>(order_by(&VlanRow::name))) {
            result.push_back(from_row(row));
        }
        return result;
    });
}

std::vector<model::BridgeConfig> ConfigStore::list_bridges() const {
    return store_call(ObjectKind::BRIDGE, "", [&] {
        using namespace sqlite_orm;
        std::lock_guard<std::mutex> lock(storage_mutex_);
        std::vector<model::BridgeConfig> result;
        for (auto& row : storage_->get_all<BridgeRow>(order_by(&BridgeRow::name))) {
            result.push_back(from_row(row));
        }
        return result;
    });
}

model::DesiredState ConfigStore::snapshot() const {
    model::DesiredState state;
    state.wireless = list_wireless();
    state.hotspots = list_hotspots();
    state.vlans = list_vlans();
    state.bridges = list_bridges();
    return state;
}

} // namespace db
} // namespace netprov
