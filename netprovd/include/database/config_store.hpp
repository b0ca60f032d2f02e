#pragma once

#include "database/models.hpp"
#include "model/network_objects.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netprov {
namespace core {
class Logger;
}
}

namespace netprov {
namespace db {

/**
 * Durable desired state. One SQLite table per object kind; every put or
 * remove is a single transaction, so a reader sees either the old row or
 * the new one. Failures surface as core::StoreFailure.
 */
class ConfigStore {
public:
    // ":memory:" gives a private in-process database (tests)
    explicit ConfigStore(const std::string& db_path);
    virtual ~ConfigStore() = default;

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    std::optional<model::WirelessConfig> get_wireless(const std::string& interface) const;
    std::optional<model::HotspotInstance> get_hotspot(const std::string& interface) const;
    std::optional<model::VlanConfig> get_vlan(const std::string& name) const;
    std::optional<model::BridgeConfig> get_bridge(const std::string& name) const;
    bool contains(model::ObjectKind kind, const std::string& key) const;

    // Insert or replace by key
    virtual void put(const model::WirelessConfig& config);
    virtual void put(const model::HotspotInstance& hotspot);
    virtual void put(const model::VlanConfig& vlan);
    virtual void put(const model::BridgeConfig& bridge);

    // False when no row existed
    virtual bool remove(model::ObjectKind kind, const std::string& key);

    std::vector<model::WirelessConfig> list_wireless() const;
    std::vector<model::HotspotInstance> list_hotspots() const;
    std::vector<model::VlanConfig> list_vlans() const;
    std::vector<model::BridgeConfig> list_bridges() const;

    model::DesiredState snapshot() const;

    const std::string& path() const { return path_; }

private:
    std::shared_ptr<std::mutex> key_lock(model::ObjectKind kind, const std::string& key);

    std::string path_;
    std::shared_ptr<Storage> storage_;
    mutable std::mutex storage_mutex_;

    std::mutex key_locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> key_locks_;

    std::shared_ptr<core::Logger> logger_;
};

} // namespace db
} // namespace netprov
