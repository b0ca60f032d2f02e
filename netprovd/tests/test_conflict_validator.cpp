/**
 * Admission rule tests
 */

#include <unity.h>

#include "core/errors.hpp"
#include "services/conflict_validator.hpp"

#include <string>
#include <vector>

using namespace netprov;
using model::InterfaceType;
using services::ConflictValidator;
using services::ValidationResult;

static ConflictValidator validator;
static model::DesiredState state;
static std::vector<model::Interface> links;

static model::Interface make_link(const std::string& name, InterfaceType type, bool up = true) {
    model::Interface link;
    link.name = name;
    link.type = type;
    link.status = up ? model::LinkStatus::UP : model::LinkStatus::DOWN;
    link.admin_up = up;
    return link;
}

static model::WirelessConfig make_ap(const std::string& interface, const std::string& ssid = "Cafe") {
    model::WirelessConfig ap;
    ap.interface = interface;
    ap.ssid = ssid;
    ap.password = "supersecret";
    ap.channel = 6;
    ap.hw_mode = "g";
    return ap;
}

static model::HotspotInstance make_hotspot(const std::string& interface, const std::string& ip,
                                           const std::string& low, const std::string& high) {
    model::HotspotInstance hotspot;
    hotspot.interface = interface;
    hotspot.ip_address = ip;
    hotspot.dhcp_range = {low, high};
    return hotspot;
}

static model::VlanConfig make_vlan(const std::string& parent, int id) {
    model::VlanConfig vlan;
    vlan.parent_interface = parent;
    vlan.id = id;
    vlan.name = model::VlanConfig::derive_name(parent, id);
    return vlan;
}

static model::BridgeConfig make_bridge(const std::string& name, std::vector<std::string> members) {
    model::BridgeConfig bridge;
    bridge.name = name;
    bridge.members = std::move(members);
    return bridge;
}

void setUp() {
    state = model::DesiredState();
    links = {make_link("lo", InterfaceType::LOOPBACK), make_link("eth0", InterfaceType::ETHERNET),
             make_link("eth1", InterfaceType::ETHERNET, false), make_link("wlan0", InterfaceType::WIFI, false),
             make_link("wlan1", InterfaceType::WIFI, false)};
}

void tearDown() {}

//==============================================================================
// Wireless
//==============================================================================

void test_wireless_accepts_valid_access_point() {
    TEST_ASSERT_TRUE(validator.check(make_ap("wlan0"), state, links).is_ok());
}

void test_wireless_rejects_bad_shapes() {
    auto ap = make_ap("wlan0", "");
    TEST_ASSERT_TRUE(validator.check(ap, state, links).outcome == ValidationResult::Outcome::CONFLICT);

    ap = make_ap("wlan0", std::string(33, 'x'));
    TEST_ASSERT_FALSE(validator.check(ap, state, links).is_ok());

    ap = make_ap("wlan0");
    ap.password = "short";
    TEST_ASSERT_FALSE(validator.check(ap, state, links).is_ok());

    ap = make_ap("wlan0");
    ap.hw_mode = "b";
    TEST_ASSERT_FALSE(validator.check(ap, state, links).is_ok());

    ap = make_ap("wlan0");
    ap.channel = 36; // 5 GHz channel on a 2.4 GHz mode
    TEST_ASSERT_FALSE(validator.check(ap, state, links).is_ok());
}

void test_wireless_rejects_control_characters() {
    auto ap = make_ap("wlan0", "Cafe\nwpa=0");
    auto result = validator.check(ap, state, links);
    TEST_ASSERT_TRUE(result.outcome == ValidationResult::Outcome::CONFLICT);
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.reason.find("ssid"));

    ap = make_ap("wlan0");
    ap.password = "supersecret\nctrl_interface=/tmp";
    result = validator.check(ap, state, links);
    TEST_ASSERT_TRUE(result.outcome == ValidationResult::Outcome::CONFLICT);
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.reason.find("passphrase"));

    ap = make_ap("wlan0", std::string("Cafe") + '\x7f');
    TEST_ASSERT_FALSE(validator.check(ap, state, links).is_ok());

    ap = make_ap("wlan0", "Caf\xc3\xa9 & Bar");
    TEST_ASSERT_TRUE(validator.check(ap, state, links).is_ok());
}

void test_wireless_open_network_needs_no_password() {
    auto ap = make_ap("wlan0");
    ap.password.clear();
    TEST_ASSERT_TRUE(validator.check(ap, state, links).is_ok());
}

void test_wireless_five_ghz_channels() {
    TEST_ASSERT_TRUE(ConflictValidator::valid_channel("a", 36));
    TEST_ASSERT_TRUE(ConflictValidator::valid_channel("a", 165));
    TEST_ASSERT_FALSE(ConflictValidator::valid_channel("a", 37));
    TEST_ASSERT_TRUE(ConflictValidator::valid_channel("g", 14));
    TEST_ASSERT_FALSE(ConflictValidator::valid_channel("g", 0));
}

void test_wireless_missing_interface() {
    auto result = validator.check(make_ap("wlan9"), state, links);
    TEST_ASSERT_TRUE(result.outcome == ValidationResult::Outcome::INTERFACE_MISSING);
    TEST_ASSERT_EQUAL_STRING("wlan9", result.interface.c_str());
}

void test_wireless_requires_wifi_interface() {
    auto result = validator.check(make_ap("eth0"), state, links);
    TEST_ASSERT_TRUE(result.outcome == ValidationResult::Outcome::CONFLICT);
}

void test_wireless_rejects_second_access_point_on_same_radio() {
    state.wireless.push_back(make_ap("wlan0", "First"));
    auto result = validator.check(make_ap("wlan0", "Second"), state, links);
    TEST_ASSERT_TRUE(result.outcome == ValidationResult::Outcome::CONFLICT);
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.reason.find("already configured"));
}

void test_wireless_bridge_must_list_the_radio() {
    auto ap = make_ap("wlan0");
    ap.bridge = "br0";
    TEST_ASSERT_FALSE(validator.check(ap, state, links).is_ok());

    state.bridges.push_back(make_bridge("br0", {"eth1"}));
    TEST_ASSERT_FALSE(validator.check(ap, state, links).is_ok());

    state.bridges.back().members.push_back("wlan0");
    TEST_ASSERT_TRUE(validator.check(ap, state, links).is_ok());
}

void test_wireless_standalone_rejected_on_bridged_radio() {
    state.bridges.push_back(make_bridge("br0", {"wlan0"}));
    TEST_ASSERT_FALSE(validator.check(make_ap("wlan0"), state, links).is_ok());

    setUp();
    links[3].master = "br9";
    TEST_ASSERT_FALSE(validator.check(make_ap("wlan0"), state, links).is_ok());
}

//==============================================================================
// Hotspot
//==============================================================================

void test_hotspot_accepts_valid_segment() {
    auto hotspot = make_hotspot("eth1", "10.0.10.1", "10.0.10.50", "10.0.10.250");
    TEST_ASSERT_TRUE(validator.check(hotspot, state, links).is_ok());
}

void test_hotspot_rejects_bad_addresses() {
    TEST_ASSERT_FALSE(validator.check(make_hotspot("eth1", "10.0.10", "10.0.10.50", "10.0.10.250"), state, links).is_ok());
    TEST_ASSERT_FALSE(validator.check(make_hotspot("eth1", "10.0.10.0", "10.0.10.50", "10.0.10.250"), state, links).is_ok());
    TEST_ASSERT_FALSE(validator.check(make_hotspot("eth1", "10.0.10.255", "10.0.10.50", "10.0.10.250"), state, links).is_ok());
    TEST_ASSERT_FALSE(validator.check(make_hotspot("eth1", "10.0.10.1", "10.0.10.250", "10.0.10.50"), state, links).is_ok());
    TEST_ASSERT_FALSE(validator.check(make_hotspot("eth1", "10.0.10.1", "10.0.10.50", "10.0.11.20"), state, links).is_ok());
    TEST_ASSERT_FALSE(validator.check(make_hotspot("eth1", "10.0.10.100", "10.0.10.50", "10.0.10.250"), state, links).is_ok());
}

void test_hotspot_rejects_negative_bandwidth() {
    auto hotspot = make_hotspot("eth1", "10.0.10.1", "10.0.10.50", "10.0.10.250");
    hotspot.bandwidth_limit = -1;
    TEST_ASSERT_FALSE(validator.check(hotspot, state, links).is_ok());
}

void test_hotspot_rejects_loopback_and_missing_interface() {
    auto on_lo = make_hotspot("lo", "10.0.10.1", "10.0.10.50", "10.0.10.250");
    TEST_ASSERT_TRUE(validator.check(on_lo, state, links).outcome == ValidationResult::Outcome::CONFLICT);

    auto missing = make_hotspot("eth7", "10.0.10.1", "10.0.10.50", "10.0.10.250");
    TEST_ASSERT_TRUE(validator.check(missing, state, links).outcome == ValidationResult::Outcome::INTERFACE_MISSING);
}

void test_hotspot_rejects_overlapping_subnets() {
    state.hotspots.push_back(make_hotspot("eth1", "10.0.10.1", "10.0.10.50", "10.0.10.250"));
    auto second = make_hotspot("wlan0", "10.0.10.200", "10.0.10.10", "10.0.10.20");
    auto result = validator.check(second, state, links);
    TEST_ASSERT_TRUE(result.outcome == ValidationResult::Outcome::CONFLICT);
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.reason.find("overlaps"));

    auto disjoint = make_hotspot("wlan0", "10.0.20.1", "10.0.20.50", "10.0.20.250");
    TEST_ASSERT_TRUE(validator.check(disjoint, state, links).is_ok());
}

void test_hotspot_rejects_duplicate_and_bridged_interface() {
    state.hotspots.push_back(make_hotspot("eth1", "10.0.10.1", "10.0.10.50", "10.0.10.250"));
    TEST_ASSERT_FALSE(validator.check(make_hotspot("eth1", "10.0.30.1", "10.0.30.50", "10.0.30.250"), state, links).is_ok());

    state.bridges.push_back(make_bridge("br0", {"wlan1"}));
    TEST_ASSERT_FALSE(validator.check(make_hotspot("wlan1", "10.0.40.1", "10.0.40.50", "10.0.40.250"), state, links).is_ok());
}

//==============================================================================
// VLAN
//==============================================================================

void test_vlan_accepts_valid_tag() {
    TEST_ASSERT_TRUE(validator.check(make_vlan("eth0", 10), state, links).is_ok());
}

void test_vlan_rejects_out_of_range_ids() {
    TEST_ASSERT_TRUE(validator.check(make_vlan("eth0", 2), state, links).is_ok());
    TEST_ASSERT_FALSE(validator.check(make_vlan("eth0", 1), state, links).is_ok());
    TEST_ASSERT_FALSE(validator.check(make_vlan("eth0", 4095), state, links).is_ok());
    TEST_ASSERT_TRUE(validator.check(make_vlan("eth0", 4094), state, links).is_ok());
}

void test_vlan_name_must_be_derived() {
    auto vlan = make_vlan("eth0", 10);
    vlan.name = "guest";
    TEST_ASSERT_FALSE(validator.check(vlan, state, links).is_ok());
}

void test_vlan_parent_rules() {
    auto missing = validator.check(make_vlan("eth5", 10), state, links);
    TEST_ASSERT_TRUE(missing.outcome == ValidationResult::Outcome::INTERFACE_MISSING);

    links.push_back(make_link("br0", InterfaceType::BRIDGE));
    TEST_ASSERT_FALSE(validator.check(make_vlan("br0", 10), state, links).is_ok());
    TEST_ASSERT_FALSE(validator.check(make_vlan("lo", 10), state, links).is_ok());
}

void test_vlan_rejects_duplicate() {
    state.vlans.push_back(make_vlan("eth0", 10));
    TEST_ASSERT_FALSE(validator.check(make_vlan("eth0", 10), state, links).is_ok());
    TEST_ASSERT_TRUE(validator.check(make_vlan("eth0", 20), state, links).is_ok());
}

//==============================================================================
// Bridge
//==============================================================================

void test_bridge_accepts_free_members() {
    TEST_ASSERT_TRUE(validator.check(make_bridge("br0", {"eth1", "wlan0"}), state, links).is_ok());
}

void test_bridge_rejects_empty_and_missing_members() {
    TEST_ASSERT_FALSE(validator.check(make_bridge("br0", {}), state, links).is_ok());
    auto result = validator.check(make_bridge("br0", {"eth1", "eth9"}), state, links);
    TEST_ASSERT_TRUE(result.outcome == ValidationResult::Outcome::INTERFACE_MISSING);
    TEST_ASSERT_EQUAL_STRING("eth9", result.interface.c_str());
}

void test_bridge_rejects_double_enslavement() {
    state.bridges.push_back(make_bridge("br0", {"eth1"}));
    auto result = validator.check(make_bridge("br1", {"eth1"}), state, links);
    TEST_ASSERT_TRUE(result.outcome == ValidationResult::Outcome::CONFLICT);
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.reason.find("br0"));
}

void test_bridge_rejects_live_master_elsewhere() {
    links[2].master = "docker0";
    TEST_ASSERT_FALSE(validator.check(make_bridge("br0", {"eth1"}), state, links).is_ok());
}

void test_bridge_rejects_member_with_hotspot_or_standalone_ap() {
    state.hotspots.push_back(make_hotspot("eth1", "10.0.10.1", "10.0.10.50", "10.0.10.250"));
    TEST_ASSERT_FALSE(validator.check(make_bridge("br0", {"eth1"}), state, links).is_ok());

    state.wireless.push_back(make_ap("wlan0"));
    TEST_ASSERT_FALSE(validator.check(make_bridge("br0", {"wlan0"}), state, links).is_ok());
}

void test_bridge_rejects_self_and_nested_bridges() {
    TEST_ASSERT_FALSE(validator.check(make_bridge("br0", {"br0"}), state, links).is_ok());

    state.bridges.push_back(make_bridge("br1", {"eth1"}));
    links.push_back(make_link("br1", InterfaceType::BRIDGE));
    TEST_ASSERT_FALSE(validator.check(make_bridge("br0", {"br1"}), state, links).is_ok());
}

void test_bridge_rejects_name_taken_by_other_link() {
    TEST_ASSERT_FALSE(validator.check(make_bridge("eth0", {"eth1"}), state, links).is_ok());
}

//==============================================================================
// Error translation
//==============================================================================

void test_raise_if_rejected_maps_outcomes() {
    ConflictValidator::raise_if_rejected(ValidationResult::ok(), model::ObjectKind::VLAN, "eth0.10");

    bool conflict_thrown = false;
    try {
        ConflictValidator::raise_if_rejected(ValidationResult::conflict("taken"), model::ObjectKind::VLAN, "eth0.10");
    } catch (const core::ValidationConflict& e) {
        conflict_thrown = true;
        TEST_ASSERT_TRUE(e.leaves_state_unchanged());
        TEST_ASSERT_EQUAL_STRING("eth0.10", e.key().c_str());
    }
    TEST_ASSERT_TRUE(conflict_thrown);

    bool missing_thrown = false;
    try {
        ConflictValidator::raise_if_rejected(ValidationResult::interface_missing("eth0"), model::ObjectKind::VLAN,
                                             "eth0.10");
    } catch (const core::InterfaceNotFound& e) {
        missing_thrown = true;
        TEST_ASSERT_EQUAL_STRING("eth0", e.interface().c_str());
    }
    TEST_ASSERT_TRUE(missing_thrown);
}

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_wireless_accepts_valid_access_point);
    RUN_TEST(test_wireless_rejects_bad_shapes);
    RUN_TEST(test_wireless_rejects_control_characters);
    RUN_TEST(test_wireless_open_network_needs_no_password);
    RUN_TEST(test_wireless_five_ghz_channels);
    RUN_TEST(test_wireless_missing_interface);
    RUN_TEST(test_wireless_requires_wifi_interface);
    RUN_TEST(test_wireless_rejects_second_access_point_on_same_radio);
    RUN_TEST(test_wireless_bridge_must_list_the_radio);
    RUN_TEST(test_wireless_standalone_rejected_on_bridged_radio);

    RUN_TEST(test_hotspot_accepts_valid_segment);
    RUN_TEST(test_hotspot_rejects_bad_addresses);
    RUN_TEST(test_hotspot_rejects_negative_bandwidth);
    RUN_TEST(test_hotspot_rejects_loopback_and_missing_interface);
    RUN_TEST(test_hotspot_rejects_overlapping_subnets);
    RUN_TEST(test_hotspot_rejects_duplicate_and_bridged_interface);

    RUN_TEST(test_vlan_accepts_valid_tag);
    RUN_TEST(test_vlan_rejects_out_of_range_ids);
    RUN_TEST(test_vlan_name_must_be_derived);
    RUN_TEST(test_vlan_parent_rules);
    RUN_TEST(test_vlan_rejects_duplicate);

    RUN_TEST(test_bridge_accepts_free_members);
    RUN_TEST(test_bridge_rejects_empty_and_missing_members);
    RUN_TEST(test_bridge_rejects_double_enslavement);
    RUN_TEST(test_bridge_rejects_live_master_elsewhere);
    RUN_TEST(test_bridge_rejects_member_with_hotspot_or_standalone_ap);
    RUN_TEST(test_bridge_rejects_self_and_nested_bridges);
    RUN_TEST(test_bridge_rejects_name_taken_by_other_link);

    RUN_TEST(test_raise_if_rejected_maps_outcomes);

    return UNITY_END();
}
