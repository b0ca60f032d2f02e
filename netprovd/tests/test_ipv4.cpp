/**
 * IPv4 helper tests
 */

#include <unity.h>

#include "model/ipv4.hpp"
#include "model/network_objects.hpp"

using netprov::model::DhcpRange;
using netprov::model::Ipv4Address;
using netprov::model::Ipv4Subnet;

void setUp() {}
void tearDown() {}

void test_parse_dotted_quad() {
    auto address = Ipv4Address::parse("10.0.10.1");
    TEST_ASSERT_TRUE(address.has_value());
    TEST_ASSERT_EQUAL_UINT32(0x0A000A01u, address->value());
    TEST_ASSERT_EQUAL_STRING("10.0.10.1", address->to_string().c_str());
}

void test_parse_rejects_malformed_text() {
    TEST_ASSERT_FALSE(Ipv4Address::parse("").has_value());
    TEST_ASSERT_FALSE(Ipv4Address::parse("10.0.10").has_value());
    TEST_ASSERT_FALSE(Ipv4Address::parse("10.0.10.256").has_value());
    TEST_ASSERT_FALSE(Ipv4Address::parse("10.0.10.1/24").has_value());
    TEST_ASSERT_FALSE(Ipv4Address::parse("gateway.local").has_value());
    TEST_ASSERT_FALSE(Ipv4Address::parse("10..10.1").has_value());
}

void test_subnet_bounds_for_slash_24() {
    Ipv4Subnet subnet(*Ipv4Address::parse("10.0.10.1"), 24);
    TEST_ASSERT_EQUAL_STRING("10.0.10.0", subnet.network().to_string().c_str());
    TEST_ASSERT_EQUAL_STRING("10.0.10.255", subnet.broadcast().to_string().c_str());
    TEST_ASSERT_EQUAL_STRING("255.255.255.0", subnet.netmask().c_str());
    TEST_ASSERT_EQUAL_STRING("10.0.10.0/24", subnet.to_string().c_str());
}

void test_subnet_contains() {
    Ipv4Subnet subnet(*Ipv4Address::parse("192.168.50.1"), 24);
    TEST_ASSERT_TRUE(subnet.contains(*Ipv4Address::parse("192.168.50.200")));
    TEST_ASSERT_FALSE(subnet.contains(*Ipv4Address::parse("192.168.51.1")));
}

void test_subnet_overlap() {
    Ipv4Subnet a(*Ipv4Address::parse("10.0.10.1"), 24);
    Ipv4Subnet b(*Ipv4Address::parse("10.0.10.77"), 24);
    Ipv4Subnet c(*Ipv4Address::parse("10.0.11.1"), 24);
    Ipv4Subnet wide(*Ipv4Address::parse("10.0.0.0"), 16);

    TEST_ASSERT_TRUE(a.overlaps(b));
    TEST_ASSERT_FALSE(a.overlaps(c));
    TEST_ASSERT_TRUE(wide.overlaps(c));
    TEST_ASSERT_TRUE(c.overlaps(wide));
}

void test_dhcp_range_parse() {
    auto range = DhcpRange::parse("10.0.10.50,10.0.10.250");
    TEST_ASSERT_TRUE(range.has_value());
    TEST_ASSERT_EQUAL_STRING("10.0.10.50", range->low.c_str());
    TEST_ASSERT_EQUAL_STRING("10.0.10.250", range->high.c_str());
    TEST_ASSERT_EQUAL_STRING("10.0.10.50,10.0.10.250", range->to_string().c_str());

    TEST_ASSERT_FALSE(DhcpRange::parse("10.0.10.50").has_value());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_parse_dotted_quad);
    RUN_TEST(test_parse_rejects_malformed_text);
    RUN_TEST(test_subnet_bounds_for_slash_24);
    RUN_TEST(test_subnet_contains);
    RUN_TEST(test_subnet_overlap);
    RUN_TEST(test_dhcp_range_parse);
    return UNITY_END();
}
