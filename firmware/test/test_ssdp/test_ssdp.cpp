#include <unity.h>
#include <cstring>
#include <string>
#include "protocols/ssdp.h"
#include "discovery/ssdp_discovery.h"
#include "support/fake_transport.h"
#include "support/recording_sink.h"

using namespace tvscout;

void setUp(void) {}
void tearDown(void) {}

static const char* RENDERER_DESC =
    "<root><device>"
    "<deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>"
    "<friendlyName>Living Room TV</friendlyName>"
    "<manufacturer>Sony Corporation</manufacturer>"
    "<modelName>KD-55XH9005</modelName>"
    "</device></root>";

static std::string ssdpReply(const char* location, const char* st) {
    std::string r = "HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=1800\r\n";
    r += std::string("LOCATION: ") + location + "\r\n";
    r += std::string("ST: ") + st + "\r\n";
    r += "USN: uuid:4d696e69-444c-164e-9d41-b827eb54e4a6::upnp:rootdevice\r\n";
    r += "SERVER: Linux/4.4 UPnP/1.0 Sony-BRAVIA/1.0\r\n\r\n";
    return r;
}

static DiscoveryOptions sessionOptions(unsigned long timeoutMs) {
    DiscoveryOptions o;
    initOptions(o);
    o.timeoutMs = timeoutMs;
    return o;
}

// --- wire format ---

void test_msearch_format(void) {
    char buf[256];
    int n = buildMSearch("ssdp:all", buf, sizeof(buf));
    TEST_ASSERT_GREATER_THAN(0, n);
    TEST_ASSERT_EQUAL_INT(0, strncmp(buf, "M-SEARCH * HTTP/1.1\r\n", 21));
    TEST_ASSERT_NOT_NULL(strstr(buf, "HOST: 239.255.255.250:1900\r\n"));
    TEST_ASSERT_NOT_NULL(strstr(buf, "MAN: \"ssdp:discover\"\r\n"));
    TEST_ASSERT_NOT_NULL(strstr(buf, "MX: 3\r\n"));
    TEST_ASSERT_NOT_NULL(strstr(buf, "ST: ssdp:all\r\n"));
    TEST_ASSERT_EQUAL_INT(0, strcmp(buf + n - 4, "\r\n\r\n"));
}

void test_msearch_small_buffer(void) {
    char buf[32];
    TEST_ASSERT_EQUAL_INT(-1, buildMSearch("ssdp:all", buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_INT(-1, buildMSearch(nullptr, buf, sizeof(buf)));
}

void test_search_targets(void) {
    TEST_ASSERT_EQUAL_INT(4, NUM_SSDP_SEARCH_TARGETS);
    TEST_ASSERT_EQUAL_STRING("ssdp:all", SSDP_SEARCH_TARGETS[0]);
    TEST_ASSERT_EQUAL_STRING("urn:dial-multiscreen-org:service:dial:1", SSDP_SEARCH_TARGETS[3]);
}

void test_parse_headers(void) {
    std::string raw = ssdpReply("http://10.0.0.2:52323/dmr.xml", "upnp:rootdevice");
    SsdpHeaders h;
    TEST_ASSERT_TRUE(parseSsdpHeaders(raw.c_str(), raw.size(), h));
    TEST_ASSERT_EQUAL_INT(5, h.count);
    TEST_ASSERT_EQUAL_STRING("CACHE-CONTROL", h.entries[0].key);
    TEST_ASSERT_EQUAL_STRING("http://10.0.0.2:52323/dmr.xml", findSsdpHeader(h, "location"));
    TEST_ASSERT_EQUAL_STRING("upnp:rootdevice", findSsdpHeader(h, "St"));
    TEST_ASSERT_NULL(findSsdpHeader(h, "NT"));
}

void test_parse_headers_lowercase_keys(void) {
    const char* raw = "NOTIFY * HTTP/1.1\r\nlocation: http://10.0.0.3/d.xml\r\nnts: ssdp:alive\r\n\r\n";
    SsdpHeaders h;
    TEST_ASSERT_TRUE(parseSsdpHeaders(raw, strlen(raw), h));
    TEST_ASSERT_EQUAL_STRING("LOCATION", h.entries[0].key);
    TEST_ASSERT_EQUAL_STRING("NTS", h.entries[1].key);
}

void test_parse_headers_none(void) {
    SsdpHeaders h;
    TEST_ASSERT_FALSE(parseSsdpHeaders("HTTP/1.1 200 OK\r\n\r\n", 19, h));
    TEST_ASSERT_EQUAL_INT(0, h.count);
}

// --- discovery session ---

void test_start_sends_every_target(void) {
    FakeTransport t;
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);

    TEST_ASSERT_TRUE(ssdp.start(sessionOptions(15000), 0));
    TEST_ASSERT_EQUAL_INT(4, t.countSent("M-SEARCH"));
    TEST_ASSERT_EQUAL_STRING("239.255.255.250", t.sent[0].toIp.c_str());
    TEST_ASSERT_EQUAL_UINT16(1900, t.sent[0].toPort);
}

void test_searches_repeat_on_interval(void) {
    FakeTransport t;
    SsdpDiscovery ssdp(t);
    ssdp.start(sessionOptions(15000), 0);

    ssdp.poll(1999);
    TEST_ASSERT_EQUAL_INT(4, t.countSent("M-SEARCH"));
    ssdp.poll(2000);
    TEST_ASSERT_EQUAL_INT(8, t.countSent("M-SEARCH"));
}

void test_response_fetches_description(void) {
    FakeTransport t;
    t.addHttp("192.168.1.30", 52323, "/dmr.xml", 200, RENDERER_DESC);
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);
    ssdp.start(sessionOptions(15000), 0);

    t.queueUdp(1900, "192.168.1.30",
               ssdpReply("http://192.168.1.30:52323/dmr.xml",
                         "urn:schemas-upnp-org:device:MediaRenderer:1"));
    ssdp.poll(100);

    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    const DiscoveredDevice& d = sink.devices[0];
    TEST_ASSERT_EQUAL_STRING("192.168.1.30", d.address);
    TEST_ASSERT_EQUAL_STRING("Living Room TV", d.displayName);
    TEST_ASSERT_EQUAL_INT((int)DiscoveryMethod::SSDP, (int)d.method);
    TEST_ASSERT_EQUAL_STRING("http://192.168.1.30:52323/dmr.xml", d.location);
    TEST_ASSERT_EQUAL_STRING("Sony Corporation", d.manufacturer);
    TEST_ASSERT_EQUAL_STRING("KD-55XH9005", d.modelName);
    TEST_ASSERT_EQUAL_STRING("MediaRenderer", d.serviceType);
    TEST_ASSERT_EQUAL_UINT16(52323, d.port);
    TEST_ASSERT_EQUAL_STRING("Linux/4.4 UPnP/1.0 Sony-BRAVIA/1.0", getHeader(d, "SERVER"));
    TEST_ASSERT_NOT_NULL(getHeader(d, "USN"));
    TEST_ASSERT_NULL(getHeader(d, "CACHE-CONTROL"));
}

void test_repeated_responder_fetched_once(void) {
    FakeTransport t;
    t.addHttp("192.168.1.30", 52323, "/dmr.xml", 200, RENDERER_DESC);
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);
    ssdp.start(sessionOptions(15000), 0);

    std::string reply = ssdpReply("http://192.168.1.30:52323/dmr.xml", "upnp:rootdevice");
    t.queueUdp(1900, "192.168.1.30", reply);
    t.queueUdp(1900, "192.168.1.30", reply);
    ssdp.poll(100);
    t.queueUdp(1900, "192.168.1.30", reply);
    ssdp.poll(200);

    TEST_ASSERT_EQUAL_INT(1, (int)t.tcpConnects.size());
    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_INT(1, ssdp.processedCount());
}

void test_description_without_name_uses_fallback(void) {
    FakeTransport t;
    t.addHttp("192.168.1.31", 8008, "/ssdp/device-desc.xml", 200,
              "<root><device><manufacturer>Google Inc.</manufacturer></device></root>");
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);
    ssdp.start(sessionOptions(15000), 0);

    t.queueUdp(1900, "192.168.1.31",
               ssdpReply("http://192.168.1.31:8008/ssdp/device-desc.xml",
                         "urn:dial-multiscreen-org:service:dial:1"));
    ssdp.poll(50);

    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_STRING("Smart Device", sink.devices[0].displayName);
    TEST_ASSERT_EQUAL_STRING("Google Inc.", sink.devices[0].manufacturer);
}

void test_failed_description_emits_nothing(void) {
    FakeTransport t;
    t.endpoint("192.168.1.32", 80);  // answers 404 to everything
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);
    ssdp.start(sessionOptions(15000), 0);

    t.queueUdp(1900, "192.168.1.32", ssdpReply("http://192.168.1.32/desc.xml", "ssdp:all"));
    ssdp.poll(50);

    TEST_ASSERT_EQUAL_INT(0, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_INT(0, (int)sink.errors.size());
    TEST_ASSERT_TRUE(ssdp.isActive());
}

void test_response_without_location_ignored(void) {
    FakeTransport t;
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);
    ssdp.start(sessionOptions(15000), 0);

    t.queueUdp(1900, "192.168.1.33", "HTTP/1.1 200 OK\r\nST: ssdp:all\r\n\r\n");
    ssdp.poll(50);

    TEST_ASSERT_EQUAL_INT(0, (int)t.tcpConnects.size());
    TEST_ASSERT_EQUAL_INT(0, ssdp.processedCount());
}

void test_socket_failure_reports_transport_error(void) {
    FakeTransport t;
    t.udpOpenFails = true;
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);

    TEST_ASSERT_FALSE(ssdp.start(sessionOptions(15000), 0));
    TEST_ASSERT_EQUAL_INT(1, (int)sink.errors.size());
    TEST_ASSERT_EQUAL_INT((int)DiscoveryError::TRANSPORT, (int)sink.errors[0].error);
    TEST_ASSERT_EQUAL_INT(1, sink.completions);
}

void test_timeout_completes_and_releases(void) {
    FakeTransport t;
    t.endpoint("192.168.1.34", 80, FakeTransport::Connect::HANG);
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);
    ssdp.start(sessionOptions(1000), 0);

    t.queueUdp(1900, "192.168.1.34", ssdpReply("http://192.168.1.34/desc.xml", "ssdp:all"));
    ssdp.poll(10);
    TEST_ASSERT_EQUAL_INT(2, t.openHandles());

    ssdp.poll(1000);
    TEST_ASSERT_FALSE(ssdp.isActive());
    TEST_ASSERT_EQUAL_INT(1, sink.completions);
    TEST_ASSERT_EQUAL_INT(0, t.openHandles());
}

void test_stop_is_idempotent(void) {
    FakeTransport t;
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);
    ssdp.start(sessionOptions(0), 0);

    ssdp.stop();
    ssdp.stop();
    TEST_ASSERT_EQUAL_INT(1, sink.completions);
    TEST_ASSERT_EQUAL_INT(0, t.openHandles());
}

void test_restart_drops_old_session_silently(void) {
    FakeTransport t;
    RecordingSink sink;
    SsdpDiscovery ssdp(t);
    ssdp.setSink(&sink);
    ssdp.start(sessionOptions(0), 0);
    ssdp.start(sessionOptions(0), 100);

    TEST_ASSERT_EQUAL_INT(0, sink.completions);
    TEST_ASSERT_EQUAL_INT(1, t.openHandles());
    TEST_ASSERT_EQUAL_INT(8, t.countSent("M-SEARCH"));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_msearch_format);
    RUN_TEST(test_msearch_small_buffer);
    RUN_TEST(test_search_targets);
    RUN_TEST(test_parse_headers);
    RUN_TEST(test_parse_headers_lowercase_keys);
    RUN_TEST(test_parse_headers_none);
    RUN_TEST(test_start_sends_every_target);
    RUN_TEST(test_searches_repeat_on_interval);
    RUN_TEST(test_response_fetches_description);
    RUN_TEST(test_repeated_responder_fetched_once);
    RUN_TEST(test_description_without_name_uses_fallback);
    RUN_TEST(test_failed_description_emits_nothing);
    RUN_TEST(test_response_without_location_ignored);
    RUN_TEST(test_socket_failure_reports_transport_error);
    RUN_TEST(test_timeout_completes_and_releases);
    RUN_TEST(test_stop_is_idempotent);
    RUN_TEST(test_restart_drops_old_session_silently);
    return UNITY_END();
}
