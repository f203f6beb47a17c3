#include <unity.h>
#include <cstdio>
#include <cstring>
#include "devices/discovered_device.h"
#include "util/text.h"

using namespace tvscout;

void setUp(void) {}
void tearDown(void) {}

static DiscoveredDevice makeDevice(const char* name, const char* serviceType,
                                   const char* manufacturer) {
    DiscoveredDevice d;
    initDevice(d);
    setField(d.address, sizeof(d.address), "192.168.1.20");
    setField(d.displayName, sizeof(d.displayName), name);
    setField(d.serviceType, sizeof(d.serviceType), serviceType);
    setField(d.manufacturer, sizeof(d.manufacturer), manufacturer);
    return d;
}

// --- initDevice ---

void test_init_device_clears_everything(void) {
    DiscoveredDevice d;
    memset(&d, 0x5A, sizeof(d));
    initDevice(d);
    TEST_ASSERT_EQUAL_STRING("", d.address);
    TEST_ASSERT_EQUAL_STRING("", d.displayName);
    TEST_ASSERT_EQUAL_UINT16(0, d.port);
    TEST_ASSERT_EQUAL_INT(0, d.headerCount);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TvBrand::UNKNOWN, (uint8_t)d.brand);
    TEST_ASSERT_FALSE(d.brandDetected);
}

void test_set_field_truncates(void) {
    char buf[6];
    TEST_ASSERT_FALSE(setField(buf, sizeof(buf), "Living Room"));
    TEST_ASSERT_EQUAL_STRING("Livin", buf);
    TEST_ASSERT_TRUE(setField(buf, sizeof(buf), nullptr));
    TEST_ASSERT_EQUAL_STRING("", buf);
}

// --- placeholder predicate ---

void test_placeholder_identifying_prefix(void) {
    TEST_ASSERT_TRUE(isPlaceholderName("Identifying (192.168.1.20)..."));
    TEST_ASSERT_TRUE(isPlaceholderName("Identifying"));
}

void test_placeholder_ellipsis_anywhere(void) {
    TEST_ASSERT_TRUE(isPlaceholderName("Loading..."));
    TEST_ASSERT_TRUE(isPlaceholderName("TV \xE2\x80\xA6"));
}

void test_placeholder_real_names(void) {
    TEST_ASSERT_FALSE(isPlaceholderName("Living Room TV"));
    TEST_ASSERT_FALSE(isPlaceholderName("My identifying TV"));
    TEST_ASSERT_FALSE(isPlaceholderName("Two.Dots.."));
    TEST_ASSERT_FALSE(isPlaceholderName(""));
    TEST_ASSERT_FALSE(isPlaceholderName(nullptr));
}

// --- authority ---

void test_authority_ranking(void) {
    TEST_ASSERT_TRUE(authorityRank(DiscoveryMethod::SSDP) > authorityRank(DiscoveryMethod::MDNS));
    TEST_ASSERT_TRUE(authorityRank(DiscoveryMethod::MDNS) > authorityRank(DiscoveryMethod::DIRECT_IP));
    TEST_ASSERT_EQUAL_INT(authorityRank(DiscoveryMethod::DIRECT_IP),
                          authorityRank(DiscoveryMethod::CODE_SCAN));
    TEST_ASSERT_TRUE(authorityRank(DiscoveryMethod::CODE_SCAN) > authorityRank(DiscoveryMethod::PORT_PROBE));
}

void test_only_ssdp_is_authority(void) {
    TEST_ASSERT_TRUE(isAuthoritySource(DiscoveryMethod::SSDP));
    TEST_ASSERT_FALSE(isAuthoritySource(DiscoveryMethod::MDNS));
    TEST_ASSERT_FALSE(isAuthoritySource(DiscoveryMethod::PORT_PROBE));
    TEST_ASSERT_FALSE(isAuthoritySource(DiscoveryMethod::DIRECT_IP));
    TEST_ASSERT_FALSE(isAuthoritySource(DiscoveryMethod::CODE_SCAN));
}

// --- device type ---

void test_type_media_renderer_is_tv(void) {
    DiscoveredDevice d = makeDevice("[TV] Samsung Q80", "MediaRenderer", "Samsung Electronics");
    TEST_ASSERT_EQUAL_UINT8((uint8_t)DeviceType::TV, (uint8_t)deviceType(d));
    TEST_ASSERT_TRUE(isControllable(d));
}

void test_type_gateway_beats_tv_tokens(void) {
    DiscoveredDevice d = makeDevice("TV Room Router", "InternetGatewayDevice", "");
    TEST_ASSERT_EQUAL_UINT8((uint8_t)DeviceType::MODEM, (uint8_t)deviceType(d));
    TEST_ASSERT_FALSE(isControllable(d));
}

void test_type_gateway_manufacturer(void) {
    DiscoveredDevice d = makeDevice("Home", "", "TP-Link");
    TEST_ASSERT_EQUAL_UINT8((uint8_t)DeviceType::MODEM, (uint8_t)deviceType(d));
}

void test_type_projector_is_tv(void) {
    DiscoveredDevice d = makeDevice("Epson", "PJLink Projector", "EPSON");
    TEST_ASSERT_EQUAL_UINT8((uint8_t)DeviceType::TV, (uint8_t)deviceType(d));
}

void test_type_speaker(void) {
    DiscoveredDevice d = makeDevice("Kitchen Sonos", "ZonePlayer", "Sonos, Inc.");
    TEST_ASSERT_EQUAL_UINT8((uint8_t)DeviceType::SPEAKER, (uint8_t)deviceType(d));
}

void test_type_other(void) {
    DiscoveredDevice d = makeDevice("NAS", "Basic", "Synology");
    TEST_ASSERT_EQUAL_UINT8((uint8_t)DeviceType::OTHER, (uint8_t)deviceType(d));
}

// --- display name ---

void test_custom_name_overrides(void) {
    DiscoveredDevice d = makeDevice("Samsung Q80", "", "");
    TEST_ASSERT_EQUAL_STRING("Samsung Q80", displayNameOf(d));
    setField(d.customName, sizeof(d.customName), "Bedroom");
    TEST_ASSERT_EQUAL_STRING("Bedroom", displayNameOf(d));
}

// --- headers ---

void test_set_header_uppercases_and_replaces(void) {
    DiscoveredDevice d;
    initDevice(d);
    TEST_ASSERT_TRUE(setHeader(d, "st", "urn:dial-multiscreen-org:service:dial:1"));
    TEST_ASSERT_EQUAL_STRING("ST", d.headers[0].key);
    TEST_ASSERT_TRUE(setHeader(d, "ST", "upnp:rootdevice"));
    TEST_ASSERT_EQUAL_INT(1, d.headerCount);
    TEST_ASSERT_EQUAL_STRING("upnp:rootdevice", getHeader(d, "st"));
    TEST_ASSERT_NULL(getHeader(d, "USN"));
}

void test_set_header_table_full(void) {
    DiscoveredDevice d;
    initDevice(d);
    char key[8];
    for (int i = 0; i < MAX_PROTOCOL_HEADERS; i++) {
        snprintf(key, sizeof(key), "K%d", i);
        TEST_ASSERT_TRUE(setHeader(d, key, "v"));
    }
    TEST_ASSERT_FALSE(setHeader(d, "EXTRA", "v"));
    TEST_ASSERT_EQUAL_INT(MAX_PROTOCOL_HEADERS, d.headerCount);
}

// --- names ---

void test_method_names_round_trip(void) {
    DiscoveryMethod m;
    TEST_ASSERT_TRUE(discoveryMethodFromString("networkProbe", m));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)DiscoveryMethod::PORT_PROBE, (uint8_t)m);
    TEST_ASSERT_EQUAL_STRING("qr", discoveryMethodToString(DiscoveryMethod::CODE_SCAN));
    TEST_ASSERT_FALSE(discoveryMethodFromString("bluetooth", m));
}

void test_brand_names(void) {
    TvBrand b;
    TEST_ASSERT_TRUE(tvBrandFromString("torima", b));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TvBrand::TORIMA, (uint8_t)b);
    TEST_ASSERT_EQUAL_STRING("lg", tvBrandToString(TvBrand::LG));
    TEST_ASSERT_EQUAL_STRING("unknown", tvBrandToString((TvBrand)99));
    TEST_ASSERT_FALSE(tvBrandFromString("Samsung", b));
}

// --- text helpers ---

void test_text_ipv4_validation(void) {
    TEST_ASSERT_TRUE(isValidIpv4("10.0.0.5"));
    TEST_ASSERT_TRUE(isValidIpv4("255.255.255.255"));
    TEST_ASSERT_FALSE(isValidIpv4("256.1.1.1"));
    TEST_ASSERT_FALSE(isValidIpv4("10.0.0"));
    TEST_ASSERT_FALSE(isValidIpv4("10.0.0.5.1"));
    TEST_ASSERT_FALSE(isValidIpv4("tv.local"));
    TEST_ASSERT_FALSE(isValidIpv4(""));
}

void test_text_case_helpers(void) {
    TEST_ASSERT_TRUE(equalsNoCase("Samsung", "SAMSUNG"));
    TEST_ASSERT_FALSE(equalsNoCase("Samsung", "Samsung Electronics"));
    TEST_ASSERT_TRUE(containsNoCase("urn:Samsung.COM:device", "samsung.com"));
    TEST_ASSERT_FALSE(containsNoCase(nullptr, "x"));
}

void test_text_copy_trimmed(void) {
    char out[16];
    const char* src = "  Bravia  ";
    size_t n = copyTrimmed(out, sizeof(out), src, strlen(src));
    TEST_ASSERT_EQUAL_UINT32(6, (uint32_t)n);
    TEST_ASSERT_EQUAL_STRING("Bravia", out);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_init_device_clears_everything);
    RUN_TEST(test_set_field_truncates);
    RUN_TEST(test_placeholder_identifying_prefix);
    RUN_TEST(test_placeholder_ellipsis_anywhere);
    RUN_TEST(test_placeholder_real_names);
    RUN_TEST(test_authority_ranking);
    RUN_TEST(test_only_ssdp_is_authority);
    RUN_TEST(test_type_media_renderer_is_tv);
    RUN_TEST(test_type_gateway_beats_tv_tokens);
    RUN_TEST(test_type_gateway_manufacturer);
    RUN_TEST(test_type_projector_is_tv);
    RUN_TEST(test_type_speaker);
    RUN_TEST(test_type_other);
    RUN_TEST(test_custom_name_overrides);
    RUN_TEST(test_set_header_uppercases_and_replaces);
    RUN_TEST(test_set_header_table_full);
    RUN_TEST(test_method_names_round_trip);
    RUN_TEST(test_brand_names);
    RUN_TEST(test_text_ipv4_validation);
    RUN_TEST(test_text_case_helpers);
    RUN_TEST(test_text_copy_trimmed);
    return UNITY_END();
}
