/**
 * Engine configuration tests
 */

#include <unity.h>

#include "core/config.hpp"
#include "fake_system.hpp"

#include <fstream>
#include <stdexcept>

using namespace netprov;
using core::EngineConfig;

void setUp() {}
void tearDown() {}

void test_defaults_are_valid() {
    auto config = EngineConfig::create_default();
    TEST_ASSERT_TRUE(config->validate());
    TEST_ASSERT_EQUAL_INT(8090, config->api.port);
    TEST_ASSERT_EQUAL_INT(80, config->hotspot.portal_port);
    TEST_ASSERT_EQUAL_INT(20, config->timeouts.command_seconds);
}

void test_dnsmasq_scopes_live_outside_system_conf_dir() {
    auto config = EngineConfig::create_default();
    TEST_ASSERT_EQUAL_STRING("/etc/netprov/dnsmasq", config->paths.dnsmasq_dir.c_str());
    TEST_ASSERT_TRUE(config->paths.dnsmasq_dir.rfind("/etc/dnsmasq.d", 0) == std::string::npos);
}

void test_partial_json_keeps_defaults() {
    auto json = nlohmann::json::parse(R"({
        "engine_id": "lab-router",
        "api": {"port": 9000},
        "hotspot": {"lease_time": "2h"}
    })");
    auto config = EngineConfig::from_json(json);

    TEST_ASSERT_EQUAL_STRING("lab-router", config->engine_id.c_str());
    TEST_ASSERT_EQUAL_INT(9000, config->api.port);
    TEST_ASSERT_EQUAL_STRING("0.0.0.0", config->api.host.c_str());
    TEST_ASSERT_EQUAL_STRING("2h", config->hotspot.lease_time.c_str());
    TEST_ASSERT_EQUAL_INT(80, config->hotspot.portal_port);
    TEST_ASSERT_EQUAL_STRING("/var/lib/netprov/state.db", config->paths.state_db.c_str());
}

void test_wrong_types_are_rejected() {
    bool thrown = false;
    try {
        EngineConfig::from_json(nlohmann::json::parse(R"({"api": {"port": "eighty"}})"));
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);

    thrown = false;
    try {
        EngineConfig::from_json(nlohmann::json::array());
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_command_timeout_bounds() {
    auto config = EngineConfig::create_default();
    config->timeouts.command_seconds = 5;
    TEST_ASSERT_FALSE(config->validate());

    config->timeouts.command_seconds = 31;
    TEST_ASSERT_FALSE(config->validate());

    config->timeouts.command_seconds = 30;
    config->timeouts.activation_seconds = 20;
    TEST_ASSERT_FALSE(config->validate());
    TEST_ASSERT_NOT_EQUAL(std::string::npos, config->validation_error().find("activation_seconds"));
}

void test_other_validation_errors() {
    auto config = EngineConfig::create_default();
    config->engine_id.clear();
    TEST_ASSERT_FALSE(config->validate());

    config = EngineConfig::create_default();
    config->paths.run_dir.clear();
    TEST_ASSERT_FALSE(config->validate());

    config = EngineConfig::create_default();
    config->hotspot.portal_port = 70000;
    TEST_ASSERT_FALSE(config->validate());

    config = EngineConfig::create_default();
    config->events.retained = 0;
    TEST_ASSERT_FALSE(config->validate());
}

void test_save_and_reload() {
    testing::ScratchDir scratch("config");
    auto path = (scratch.root() / "netprov.json").string();

    auto config = scratch.config();
    config->engine_id = "edge-1";
    config->api.enabled = false;
    config->logging.log_level = "DEBUG";
    config->save_to_file(path);

    auto loaded = EngineConfig::from_file(path);
    TEST_ASSERT_EQUAL_STRING("edge-1", loaded->engine_id.c_str());
    TEST_ASSERT_FALSE(loaded->api.enabled);
    TEST_ASSERT_EQUAL_STRING("DEBUG", loaded->logging.log_level.c_str());
    TEST_ASSERT_EQUAL_STRING(config->paths.hostapd_dir.c_str(), loaded->paths.hostapd_dir.c_str());
    TEST_ASSERT_EQUAL_INT(8080, loaded->hotspot.portal_port);
    TEST_ASSERT_TRUE(loaded->to_json() == config->to_json());
}

void test_missing_and_broken_files() {
    testing::ScratchDir scratch("config-bad");

    bool thrown = false;
    try {
        EngineConfig::from_file((scratch.root() / "absent.json").string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);

    auto broken = scratch.root() / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ \"engine_id\": ";
    }
    thrown = false;
    try {
        EngineConfig::from_file(broken.string());
    } catch (const std::runtime_error& e) {
        thrown = true;
        TEST_ASSERT_NOT_EQUAL(std::string::npos, std::string(e.what()).find("Invalid JSON"));
    }
    TEST_ASSERT_TRUE(thrown);
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_defaults_are_valid);
    RUN_TEST(test_dnsmasq_scopes_live_outside_system_conf_dir);
    RUN_TEST(test_partial_json_keeps_defaults);
    RUN_TEST(test_wrong_types_are_rejected);
    RUN_TEST(test_command_timeout_bounds);
    RUN_TEST(test_other_validation_errors);
    RUN_TEST(test_save_and_reload);
    RUN_TEST(test_missing_and_broken_files);
    return UNITY_END();
}
