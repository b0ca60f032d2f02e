/**
 * Durable desired-state store tests
 */

#include <unity.h>

#include "core/errors.hpp"
#include "database/config_store.hpp"
#include "fake_system.hpp"

#include <memory>

using namespace netprov;
using model::ObjectKind;

static std::unique_ptr<db::ConfigStore> store;

static model::HotspotInstance guest_hotspot() {
    model::HotspotInstance hotspot;
    hotspot.interface = "eth1";
    hotspot.ip_address = "10.0.10.1";
    hotspot.dhcp_range = {"10.0.10.50", "10.0.10.250"};
    hotspot.bandwidth_limit = 10;
    hotspot.meta.config_digest = "abc123";
    hotspot.meta.link_was_up = true;
    hotspot.meta.applied_at = 1700000000;
    return hotspot;
}

static model::BridgeConfig lan_bridge() {
    model::BridgeConfig bridge;
    bridge.name = "br0";
    bridge.members = {"eth1", "wlan0"};
    bridge.stp = true;
    return bridge;
}

void setUp() {
    store = std::make_unique<db::ConfigStore>(":memory:");
}

void tearDown() {
    store.reset();
}

void test_empty_store() {
    auto state = store->snapshot();
    TEST_ASSERT_EQUAL_UINT(0, state.wireless.size());
    TEST_ASSERT_EQUAL_UINT(0, state.hotspots.size());
    TEST_ASSERT_EQUAL_UINT(0, state.vlans.size());
    TEST_ASSERT_EQUAL_UINT(0, state.bridges.size());
    TEST_ASSERT_FALSE(store->get_bridge("br0").has_value());
    TEST_ASSERT_FALSE(store->contains(ObjectKind::HOTSPOT, "eth1"));
}

void test_hotspot_keeps_every_field() {
    store->put(guest_hotspot());

    auto loaded = store->get_hotspot("eth1");
    TEST_ASSERT_TRUE(loaded.has_value());
    TEST_ASSERT_EQUAL_STRING("10.0.10.1", loaded->ip_address.c_str());
    TEST_ASSERT_EQUAL_STRING("10.0.10.50,10.0.10.250", loaded->dhcp_range.to_string().c_str());
    TEST_ASSERT_EQUAL_INT(10, loaded->bandwidth_limit);
    TEST_ASSERT_TRUE(loaded->enabled);
    TEST_ASSERT_EQUAL_STRING("abc123", loaded->meta.config_digest.c_str());
    TEST_ASSERT_TRUE(loaded->meta.link_was_up);
    TEST_ASSERT_TRUE(loaded->meta.applied_at == 1700000000);
}

void test_bridge_members_keep_their_order() {
    store->put(lan_bridge());

    auto loaded = store->get_bridge("br0");
    TEST_ASSERT_TRUE(loaded.has_value());
    TEST_ASSERT_EQUAL_UINT(2, loaded->members.size());
    TEST_ASSERT_EQUAL_STRING("eth1", loaded->members[0].c_str());
    TEST_ASSERT_EQUAL_STRING("wlan0", loaded->members[1].c_str());
    TEST_ASSERT_TRUE(loaded->stp);
}

void test_put_replaces_by_key() {
    model::WirelessConfig ap;
    ap.interface = "wlan0";
    ap.ssid = "First";
    store->put(ap);

    ap.ssid = "Second";
    ap.channel = 11;
    store->put(ap);

    auto all = store->list_wireless();
    TEST_ASSERT_EQUAL_UINT(1, all.size());
    TEST_ASSERT_EQUAL_STRING("Second", all[0].ssid.c_str());
    TEST_ASSERT_EQUAL_INT(11, all[0].channel);
    TEST_ASSERT_TRUE(all[0].is_open());
}

void test_remove_reports_existence() {
    model::VlanConfig vlan;
    vlan.id = 10;
    vlan.parent_interface = "eth0";
    vlan.name = "eth0.10";
    store->put(vlan);

    TEST_ASSERT_TRUE(store->contains(ObjectKind::VLAN, "eth0.10"));
    TEST_ASSERT_TRUE(store->remove(ObjectKind::VLAN, "eth0.10"));
    TEST_ASSERT_FALSE(store->remove(ObjectKind::VLAN, "eth0.10"));
    TEST_ASSERT_FALSE(store->get_vlan("eth0.10").has_value());
}

void test_lists_are_sorted_by_key() {
    model::VlanConfig vlan;
    vlan.parent_interface = "eth0";
    for (int id : {30, 10, 20}) {
        vlan.id = id;
        vlan.name = model::VlanConfig::derive_name("eth0", id);
        store->put(vlan);
    }

    auto vlans = store->list_vlans();
    TEST_ASSERT_EQUAL_UINT(3, vlans.size());
    TEST_ASSERT_EQUAL_STRING("eth0.10", vlans[0].name.c_str());
    TEST_ASSERT_EQUAL_STRING("eth0.20", vlans[1].name.c_str());
    TEST_ASSERT_EQUAL_STRING("eth0.30", vlans[2].name.c_str());
}

void test_snapshot_sees_every_kind() {
    store->put(guest_hotspot());
    store->put(lan_bridge());

    auto state = store->snapshot();
    TEST_ASSERT_EQUAL_UINT(1, state.hotspots.size());
    TEST_ASSERT_EQUAL_UINT(1, state.bridges.size());
    TEST_ASSERT_NOT_NULL(state.bridge_of("wlan0"));
    TEST_ASSERT_NULL(state.bridge_of("eth0"));
}

void test_file_store_survives_reopen() {
    testing::ScratchDir scratch("store");
    auto path = (scratch.root() / "state" / "netprov.db").string();

    {
        db::ConfigStore first(path);
        first.put(guest_hotspot());
        first.put(lan_bridge());
    }

    db::ConfigStore second(path);
    TEST_ASSERT_EQUAL_STRING(path.c_str(), second.path().c_str());
    auto hotspot = second.get_hotspot("eth1");
    TEST_ASSERT_TRUE(hotspot.has_value());
    TEST_ASSERT_EQUAL_STRING("abc123", hotspot->meta.config_digest.c_str());
    TEST_ASSERT_TRUE(second.contains(ObjectKind::BRIDGE, "br0"));
}

void test_unopenable_path_is_a_store_failure() {
    testing::ScratchDir scratch("store-bad");
    auto blocker = scratch.root() / "file";
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    bool thrown = false;
    try {
        db::ConfigStore broken((blocker / "netprov.db").string());
    } catch (const core::StoreFailure& e) {
        thrown = true;
        TEST_ASSERT_TRUE(e.error_kind() == core::ErrorKind::STORE_FAILURE);
    }
    TEST_ASSERT_TRUE(thrown);
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_empty_store);
    RUN_TEST(test_hotspot_keeps_every_field);
    RUN_TEST(test_bridge_members_keep_their_order);
    RUN_TEST(test_put_replaces_by_key);
    RUN_TEST(test_remove_reports_existence);
    RUN_TEST(test_lists_are_sorted_by_key);
    RUN_TEST(test_snapshot_sees_every_kind);
    RUN_TEST(test_file_store_survives_reopen);
    RUN_TEST(test_unopenable_path_is_a_store_failure);
    return UNITY_END();
}
