/**
 * Segment driver tests against the scripted host
 */

#include <unity.h>

#include "drivers/bridge_driver.hpp"
#include "drivers/hotspot_driver.hpp"
#include "drivers/vlan_driver.hpp"
#include "drivers/wireless_driver.hpp"
#include "fake_system.hpp"
#include "infrastructure/staged_file.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

using namespace netprov;
using drivers::DriverResult;
using drivers::DriverState;
using model::InterfaceType;

static std::unique_ptr<testing::ScratchDir> scratch;
static std::unique_ptr<core::EngineConfig> config;
static std::unique_ptr<testing::FakeSystem> host;
static std::unique_ptr<testing::FakeCommandRunner> runner;
static std::unique_ptr<testing::FakeInterfaceSource> source;

static const char *GUEST_REDIRECT = "PREROUTING -i eth1 -p tcp --dport 80 -j REDIRECT --to-ports 8080";
static const char *GUEST_MASQUERADE = "POSTROUTING -s 10.0.10.0/24 ! -o eth1 -j MASQUERADE";

/**
 * Runner whose commands starting with a prefix take a while to return
 */
class SlowRunner : public infrastructure::CommandRunner {
public:
    SlowRunner(testing::FakeSystem &system, std::string prefix, std::chrono::milliseconds delay)
        : system_(system), prefix_(std::move(prefix)), delay_(delay) {}

    infrastructure::CommandResult run(const std::vector<std::string> &argv, std::chrono::milliseconds) override {
        if (infrastructure::format_command(argv).rfind(prefix_, 0) == 0) {
            std::this_thread::sleep_for(delay_);
        }
        return system_.execute(argv);
    }

private:
    testing::FakeSystem &system_;
    std::string prefix_;
    std::chrono::milliseconds delay_;
};

static model::HotspotInstance guest_hotspot(int bandwidth = 10) {
    model::HotspotInstance hotspot;
    hotspot.interface = "eth1";
    hotspot.ip_address = "10.0.10.1";
    hotspot.dhcp_range = {"10.0.10.50", "10.0.10.250"};
    hotspot.bandwidth_limit = bandwidth;
    return hotspot;
}

static model::WirelessConfig cafe_ap() {
    model::WirelessConfig ap;
    ap.interface = "wlan0";
    ap.ssid = "Cafe";
    ap.password = "supersecret";
    ap.channel = 6;
    return ap;
}

static model::VlanConfig office_vlan() {
    model::VlanConfig vlan;
    vlan.id = 10;
    vlan.parent_interface = "eth0";
    vlan.name = "eth0.10";
    return vlan;
}

static model::BridgeConfig lan_bridge() {
    model::BridgeConfig bridge;
    bridge.name = "br0";
    bridge.members = {"eth1", "wlan0"};
    bridge.stp = true;
    return bridge;
}

void setUp() {
    scratch = std::make_unique<testing::ScratchDir>("drivers");
    config = scratch->config();
    host = std::make_unique<testing::FakeSystem>();
    testing::seed_default_host(*host);
    runner = std::make_unique<testing::FakeCommandRunner>(*host);
    source = std::make_unique<testing::FakeInterfaceSource>(*host);
}

void tearDown() {
    source.reset();
    runner.reset();
    host.reset();
    config.reset();
    scratch.reset();
}

//==============================================================================
// Hotspot
//==============================================================================

void test_hotspot_apply_builds_segment() {
    drivers::HotspotDriver driver(*runner, *source, *config);
    auto hotspot = guest_hotspot();

    auto result = driver.apply(hotspot);
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::APPLIED);
    TEST_ASSERT_FALSE(result.meta.link_was_up);
    TEST_ASSERT_EQUAL_STRING(driver.digest(hotspot).c_str(), result.meta.config_digest.c_str());

    auto eth1 = host->link("eth1");
    TEST_ASSERT_TRUE(eth1.up);
    TEST_ASSERT_EQUAL_UINT(1, eth1.addresses.size());
    TEST_ASSERT_EQUAL_STRING("10.0.10.1/24", eth1.addresses[0].c_str());
    TEST_ASSERT_EQUAL_INT(1, host->launches("dnsmasq"));
    TEST_ASSERT_TRUE(host->has_rule(GUEST_REDIRECT));
    TEST_ASSERT_TRUE(host->has_rule(GUEST_MASQUERADE));
    TEST_ASSERT_EQUAL_STRING("1", host->ip_forward().c_str());
    TEST_ASSERT_EQUAL_STRING("10mbit", host->shaping_rate("eth1").c_str());

    auto conf = infrastructure::read_text_file(driver.config_path("eth1"));
    TEST_ASSERT_TRUE(conf.has_value());
    TEST_ASSERT_NOT_EQUAL(std::string::npos, conf->find("interface=eth1\n"));
    TEST_ASSERT_NOT_EQUAL(std::string::npos, conf->find("dhcp-range=10.0.10.50,10.0.10.250,255.255.255.0,12h\n"));
    TEST_ASSERT_NOT_EQUAL(std::string::npos, conf->find("address=/#/10.0.10.1\n"));

    hotspot.meta = result.meta;
    TEST_ASSERT_TRUE(driver.probe(hotspot));
}

void test_hotspot_teardown_restores_link() {
    drivers::HotspotDriver driver(*runner, *source, *config);
    auto hotspot = guest_hotspot();
    hotspot.meta = driver.apply(hotspot).meta;

    auto result = driver.teardown(hotspot);
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::REMOVED);

    auto eth1 = host->link("eth1");
    TEST_ASSERT_FALSE(eth1.up);
    TEST_ASSERT_EQUAL_UINT(0, eth1.addresses.size());
    TEST_ASSERT_EQUAL_UINT(0, host->rule_count());
    TEST_ASSERT_FALSE(host->has_qdisc("eth1"));
    TEST_ASSERT_EQUAL_UINT(0, host->running_daemons());
    TEST_ASSERT_FALSE(std::filesystem::exists(driver.config_path("eth1")));
    TEST_ASSERT_FALSE(driver.probe(hotspot));

    // Other segments may still route through the host
    TEST_ASSERT_EQUAL_STRING("1", host->ip_forward().c_str());
}

void test_hotspot_keeps_admin_up_link_without_carrier() {
    runner->run({"ip", "link", "set", "dev", "eth1", "up"}, std::chrono::seconds(1));
    host->set_carrier("eth1", false);
    host->clear_commands();

    drivers::HotspotDriver driver(*runner, *source, *config);
    auto hotspot = guest_hotspot();
    auto result = driver.apply(hotspot);
    TEST_ASSERT_TRUE(result.ok());
    TEST_ASSERT_TRUE(result.meta.link_was_up);

    hotspot.meta = result.meta;
    TEST_ASSERT_TRUE(driver.teardown(hotspot).status == DriverResult::Status::REMOVED);
    TEST_ASSERT_TRUE(host->link("eth1").up);
    TEST_ASSERT_FALSE(host->ran("ip link set dev eth1 down"));
}

void test_hotspot_failed_uplink_nat_rolls_back() {
    drivers::HotspotDriver driver(*runner, *source, *config);
    host->fail_on("iptables -t nat -A POSTROUTING");

    auto result = driver.apply(guest_hotspot());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("uplink nat", result.step.c_str());

    TEST_ASSERT_EQUAL_UINT(0, host->rule_count());
    TEST_ASSERT_EQUAL_STRING("0", host->ip_forward().c_str());
    TEST_ASSERT_EQUAL_UINT(0, host->running_daemons());
    TEST_ASSERT_FALSE(host->link("eth1").up);
}

void test_hotspot_failed_rate_class_removes_root_qdisc() {
    drivers::HotspotDriver driver(*runner, *source, *config);
    host->fail_on("tc class replace");

    auto result = driver.apply(guest_hotspot());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("shape rate class", result.step.c_str());

    TEST_ASSERT_FALSE(host->has_qdisc("eth1"));
    TEST_ASSERT_EQUAL_UINT(0, host->rule_count());
    TEST_ASSERT_EQUAL_STRING("0", host->ip_forward().c_str());
    TEST_ASSERT_EQUAL_UINT(0, host->running_daemons());
    TEST_ASSERT_EQUAL_UINT(0, host->link("eth1").addresses.size());
}

void test_hotspot_passed_deadline_rolls_back_earlier_steps() {
    config->timeouts.activation_seconds = 1;
    SlowRunner slow(*host, "ip addr add 10.0.10.1/24", std::chrono::milliseconds(1200));
    drivers::HotspotDriver driver(slow, *source, *config);

    auto result = driver.apply(guest_hotspot());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("link up", result.step.c_str());
    TEST_ASSERT_EQUAL_STRING("activation deadline exceeded", result.cause.c_str());

    auto eth1 = host->link("eth1");
    TEST_ASSERT_FALSE(eth1.up);
    TEST_ASSERT_EQUAL_UINT(0, eth1.addresses.size());
    TEST_ASSERT_FALSE(host->ran("ip link set dev eth1 up"));
    TEST_ASSERT_EQUAL_INT(0, host->launches("dnsmasq"));
}

void test_hotspot_without_shaping_or_service() {
    drivers::HotspotDriver driver(*runner, *source, *config);

    auto unshaped = guest_hotspot(0);
    TEST_ASSERT_TRUE(driver.apply(unshaped).ok());
    TEST_ASSERT_FALSE(host->has_qdisc("eth1"));
    TEST_ASSERT_FALSE(host->ran("tc qdisc replace"));

    host->add_link("eth2", InterfaceType::ETHERNET, false);
    auto parked = guest_hotspot();
    parked.interface = "eth2";
    parked.ip_address = "10.0.20.1";
    parked.dhcp_range = {"10.0.20.50", "10.0.20.100"};
    parked.enabled = false;

    auto result = driver.apply(parked);
    TEST_ASSERT_TRUE(result.ok());
    TEST_ASSERT_EQUAL_INT(1, host->launches("dnsmasq"));
    TEST_ASSERT_EQUAL_STRING("10.0.20.1/24", host->link("eth2").addresses[0].c_str());
    TEST_ASSERT_FALSE(std::filesystem::exists(driver.config_path("eth2")));

    parked.meta = result.meta;
    TEST_ASSERT_TRUE(driver.probe(parked));
}

void test_hotspot_failed_daemon_rolls_back() {
    drivers::HotspotDriver driver(*runner, *source, *config);
    host->fail_on("dnsmasq");

    auto result = driver.apply(guest_hotspot());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("start dnsmasq", result.step.c_str());
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.cause.find("injected failure"));

    auto eth1 = host->link("eth1");
    TEST_ASSERT_FALSE(eth1.up);
    TEST_ASSERT_EQUAL_UINT(0, eth1.addresses.size());
    TEST_ASSERT_EQUAL_UINT(0, host->rule_count());
    TEST_ASSERT_FALSE(std::filesystem::exists(driver.config_path("eth1")));
}

void test_hotspot_rollback_restores_previous_addresses() {
    drivers::HotspotDriver driver(*runner, *source, *config);
    host->fail_on("iptables -t nat -A");

    auto hotspot = guest_hotspot();
    hotspot.interface = "eth0";
    auto result = driver.apply(hotspot);
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("captive redirect", result.step.c_str());

    auto eth0 = host->link("eth0");
    TEST_ASSERT_TRUE(eth0.up);
    TEST_ASSERT_EQUAL_UINT(1, eth0.addresses.size());
    TEST_ASSERT_EQUAL_STRING("192.168.1.10/24", eth0.addresses[0].c_str());
    TEST_ASSERT_EQUAL_UINT(0, host->running_daemons());
}

void test_hotspot_failed_inverse_is_reported() {
    drivers::HotspotDriver driver(*runner, *source, *config);
    host->fail_on("dnsmasq");
    host->fail_on("ip link set dev eth1 down");

    auto result = driver.apply(guest_hotspot());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::ROLLBACK_FAILED);
    TEST_ASSERT_EQUAL_STRING("start dnsmasq", result.step.c_str());
    TEST_ASSERT_EQUAL_STRING("undo link up", result.rollback_step.c_str());
    TEST_ASSERT_FALSE(result.ok());

    // Every other inverse still ran
    TEST_ASSERT_EQUAL_UINT(0, host->link("eth1").addresses.size());
}

void test_hotspot_crashed_dnsmasq_fails_probe() {
    drivers::HotspotDriver driver(*runner, *source, *config);
    auto hotspot = guest_hotspot();
    hotspot.meta = driver.apply(hotspot).meta;

    host->crash_daemon(driver.pid_path("eth1"));
    TEST_ASSERT_FALSE(driver.probe(hotspot));

    // Re-applying over the dead instance brings it back
    hotspot.meta = driver.apply(hotspot).meta;
    TEST_ASSERT_TRUE(driver.probe(hotspot));
    TEST_ASSERT_EQUAL_INT(2, host->launches("dnsmasq"));
    TEST_ASSERT_EQUAL_UINT(2, host->rule_count());
}

//==============================================================================
// Wireless
//==============================================================================

void test_wireless_apply_and_teardown() {
    drivers::WirelessDriver driver(*runner, *source, *config);
    auto ap = cafe_ap();

    auto result = driver.apply(ap);
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::APPLIED);
    TEST_ASSERT_EQUAL_INT(1, host->launches("hostapd"));
    TEST_ASSERT_TRUE(host->link("wlan0").up);

    auto conf = infrastructure::read_text_file(driver.config_path("wlan0"));
    TEST_ASSERT_TRUE(conf.has_value());
    TEST_ASSERT_NOT_EQUAL(std::string::npos, conf->find("ssid=Cafe\n"));
    TEST_ASSERT_NOT_EQUAL(std::string::npos, conf->find("wpa_passphrase=supersecret\n"));
    TEST_ASSERT_EQUAL(std::string::npos, conf->find("bridge="));

    ap.meta = result.meta;
    TEST_ASSERT_TRUE(driver.probe(ap));

    auto removed = driver.teardown(ap);
    TEST_ASSERT_TRUE(removed.status == DriverResult::Status::REMOVED);
    TEST_ASSERT_FALSE(host->link("wlan0").up);
    TEST_ASSERT_EQUAL_UINT(0, host->running_daemons());
    TEST_ASSERT_FALSE(std::filesystem::exists(driver.config_path("wlan0")));
}

void test_wireless_open_network_config() {
    drivers::WirelessDriver driver(*runner, *source, *config);
    auto ap = cafe_ap();
    ap.password.clear();
    ap.bridge = "br0";

    auto conf = driver.render_hostapd_config(ap);
    TEST_ASSERT_EQUAL(std::string::npos, conf.find("wpa="));
    TEST_ASSERT_NOT_EQUAL(std::string::npos, conf.find("bridge=br0\n"));
    TEST_ASSERT_NOT_EQUAL(std::string::npos, conf.find("hw_mode=g\n"));
}

void test_wireless_failed_start_rolls_back() {
    drivers::WirelessDriver driver(*runner, *source, *config);
    host->fail_on("hostapd");

    auto result = driver.apply(cafe_ap());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("start hostapd", result.step.c_str());
    TEST_ASSERT_FALSE(host->link("wlan0").up);
    TEST_ASSERT_FALSE(std::filesystem::exists(driver.config_path("wlan0")));
}

void test_wireless_digest_tracks_rendered_config() {
    drivers::WirelessDriver driver(*runner, *source, *config);
    auto ap = cafe_ap();
    ap.meta = driver.apply(ap).meta;

    auto changed = ap;
    changed.channel = 11;
    TEST_ASSERT_FALSE(driver.digest(changed) == ap.meta.config_digest);
    TEST_ASSERT_FALSE(driver.probe(changed));
}

void test_wireless_missing_radio() {
    drivers::WirelessDriver driver(*runner, *source, *config);
    auto ap = cafe_ap();
    ap.interface = "wlan7";

    auto result = driver.apply(ap);
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("check interface", result.step.c_str());
    TEST_ASSERT_EQUAL_INT(0, host->launches("hostapd"));
}

//==============================================================================
// VLAN
//==============================================================================

void test_vlan_apply_reports_states() {
    drivers::VlanDriver driver(*runner, *source, *config);
    std::vector<DriverState> states;
    auto listener = [&](DriverState state, const std::string &) { states.push_back(state); };

    auto vlan = office_vlan();
    auto result = driver.apply(vlan, listener);
    TEST_ASSERT_TRUE(result.ok());

    auto link = host->link("eth0.10");
    TEST_ASSERT_TRUE(link.type == InterfaceType::VLAN);
    TEST_ASSERT_TRUE(link.up);
    TEST_ASSERT_TRUE(host->ran("ip link add link eth0 name eth0.10 type vlan id 10"));

    TEST_ASSERT_EQUAL_UINT(4, states.size());
    TEST_ASSERT_TRUE(states[0] == DriverState::VALIDATING);
    TEST_ASSERT_TRUE(states[1] == DriverState::WRITING_CONFIG);
    TEST_ASSERT_TRUE(states[2] == DriverState::ACTIVATING);
    TEST_ASSERT_TRUE(states[3] == DriverState::APPLIED);

    vlan.meta = result.meta;
    TEST_ASSERT_TRUE(driver.probe(vlan));
    TEST_ASSERT_TRUE(driver.teardown(vlan).status == DriverResult::Status::REMOVED);
    TEST_ASSERT_FALSE(host->has_link("eth0.10"));
}

void test_vlan_adopts_existing_link() {
    host->add_link("eth0.10", InterfaceType::VLAN, false);
    drivers::VlanDriver driver(*runner, *source, *config);

    auto result = driver.apply(office_vlan());
    TEST_ASSERT_TRUE(result.ok());
    TEST_ASSERT_FALSE(host->ran("ip link add"));
    TEST_ASSERT_TRUE(host->link("eth0.10").up);
}

void test_vlan_failed_link_up_removes_created_link() {
    drivers::VlanDriver driver(*runner, *source, *config);
    host->fail_on("ip link set dev eth0.10 up");

    auto result = driver.apply(office_vlan());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("link up", result.step.c_str());
    TEST_ASSERT_FALSE(host->has_link("eth0.10"));
}

void test_vlan_without_activation_time_creates_nothing() {
    config->timeouts.activation_seconds = 0;
    drivers::VlanDriver driver(*runner, *source, *config);

    auto result = driver.apply(office_vlan());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("create link", result.step.c_str());
    TEST_ASSERT_EQUAL_STRING("activation deadline exceeded", result.cause.c_str());
    TEST_ASSERT_FALSE(host->ran("ip link add"));
    TEST_ASSERT_FALSE(host->has_link("eth0.10"));
}

void test_vlan_teardown_of_absent_link_succeeds() {
    drivers::VlanDriver driver(*runner, *source, *config);
    TEST_ASSERT_TRUE(driver.teardown(office_vlan()).status == DriverResult::Status::REMOVED);
    TEST_ASSERT_FALSE(host->ran("ip link delete"));
}

void test_vlan_missing_parent() {
    drivers::VlanDriver driver(*runner, *source, *config);
    auto vlan = office_vlan();
    vlan.parent_interface = "eth9";
    vlan.name = "eth9.10";

    auto result = driver.apply(vlan);
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("check parent", result.step.c_str());
}

//==============================================================================
// Bridge
//==============================================================================

void test_bridge_apply_and_teardown() {
    host->add_address("eth1", "172.16.0.2/24");
    drivers::BridgeDriver driver(*runner, *source, *config);
    auto bridge = lan_bridge();

    auto result = driver.apply(bridge);
    TEST_ASSERT_TRUE(result.ok());

    auto br0 = host->link("br0");
    TEST_ASSERT_TRUE(br0.type == InterfaceType::BRIDGE);
    TEST_ASSERT_TRUE(br0.up);
    TEST_ASSERT_EQUAL_STRING("1", br0.stp.c_str());
    TEST_ASSERT_EQUAL_STRING("br0", host->link("eth1").master.c_str());
    TEST_ASSERT_EQUAL_STRING("br0", host->link("wlan0").master.c_str());
    TEST_ASSERT_EQUAL_UINT(0, host->link("eth1").addresses.size());

    bridge.meta = result.meta;
    TEST_ASSERT_TRUE(driver.probe(bridge));

    TEST_ASSERT_TRUE(driver.teardown(bridge).status == DriverResult::Status::REMOVED);
    TEST_ASSERT_FALSE(host->has_link("br0"));
    TEST_ASSERT_EQUAL_STRING("", host->link("eth1").master.c_str());
    TEST_ASSERT_EQUAL_STRING("", host->link("wlan0").master.c_str());
}

void test_bridge_failed_enslave_releases_earlier_members() {
    host->add_address("eth1", "172.16.0.2/24");
    drivers::BridgeDriver driver(*runner, *source, *config);
    host->fail_on("ip link set dev wlan0 master");

    auto result = driver.apply(lan_bridge());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("enslave wlan0", result.step.c_str());

    TEST_ASSERT_FALSE(host->has_link("br0"));
    auto eth1 = host->link("eth1");
    TEST_ASSERT_EQUAL_STRING("", eth1.master.c_str());
    TEST_ASSERT_FALSE(eth1.up);
    TEST_ASSERT_EQUAL_UINT(1, eth1.addresses.size());
    TEST_ASSERT_EQUAL_STRING("172.16.0.2/24", eth1.addresses[0].c_str());
}

void test_bridge_failed_stp_removes_created_bridge() {
    drivers::BridgeDriver driver(*runner, *source, *config);
    host->fail_on("ip link set dev br0 type bridge stp_state");

    auto result = driver.apply(lan_bridge());
    TEST_ASSERT_TRUE(result.status == DriverResult::Status::FAILED);
    TEST_ASSERT_EQUAL_STRING("set stp", result.step.c_str());
    TEST_ASSERT_TRUE(host->ran("ip link add name br0 type bridge"));

    TEST_ASSERT_FALSE(host->has_link("br0"));
    TEST_ASSERT_EQUAL_STRING("", host->link("eth1").master.c_str());
    TEST_ASSERT_EQUAL_STRING("", host->link("wlan0").master.c_str());
}

void test_bridge_probe_detects_released_member() {
    drivers::BridgeDriver driver(*runner, *source, *config);
    auto bridge = lan_bridge();
    bridge.meta = driver.apply(bridge).meta;

    runner->run({"ip", "link", "set", "dev", "wlan0", "nomaster"}, std::chrono::seconds(1));
    TEST_ASSERT_FALSE(driver.probe(bridge));
}

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_hotspot_apply_builds_segment);
    RUN_TEST(test_hotspot_teardown_restores_link);
    RUN_TEST(test_hotspot_keeps_admin_up_link_without_carrier);
    RUN_TEST(test_hotspot_without_shaping_or_service);
    RUN_TEST(test_hotspot_failed_daemon_rolls_back);
    RUN_TEST(test_hotspot_rollback_restores_previous_addresses);
    RUN_TEST(test_hotspot_failed_inverse_is_reported);
    RUN_TEST(test_hotspot_failed_uplink_nat_rolls_back);
    RUN_TEST(test_hotspot_failed_rate_class_removes_root_qdisc);
    RUN_TEST(test_hotspot_passed_deadline_rolls_back_earlier_steps);
    RUN_TEST(test_hotspot_crashed_dnsmasq_fails_probe);

    RUN_TEST(test_wireless_apply_and_teardown);
    RUN_TEST(test_wireless_open_network_config);
    RUN_TEST(test_wireless_failed_start_rolls_back);
    RUN_TEST(test_wireless_digest_tracks_rendered_config);
    RUN_TEST(test_wireless_missing_radio);

    RUN_TEST(test_vlan_apply_reports_states);
    RUN_TEST(test_vlan_adopts_existing_link);
    RUN_TEST(test_vlan_failed_link_up_removes_created_link);
    RUN_TEST(test_vlan_without_activation_time_creates_nothing);
    RUN_TEST(test_vlan_teardown_of_absent_link_succeeds);
    RUN_TEST(test_vlan_missing_parent);

    RUN_TEST(test_bridge_apply_and_teardown);
    RUN_TEST(test_bridge_failed_enslave_releases_earlier_members);
    RUN_TEST(test_bridge_failed_stp_removes_created_bridge);
    RUN_TEST(test_bridge_probe_detects_released_member);

    return UNITY_END();
}
