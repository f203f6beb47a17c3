#include <unity.h>
#include <cstring>
#include <string>
#include "discovery/mdns_discovery.h"
#include "support/dns_builder.h"
#include "support/fake_transport.h"
#include "support/recording_sink.h"

using namespace tvscout;

void setUp(void) {}
void tearDown(void) {}

static const char* CAST_INSTANCE = "Chromecast-7f3a._googlecast._tcp.local";

static DiscoveryOptions sessionOptions(unsigned long timeoutMs) {
    DiscoveryOptions o;
    initOptions(o);
    o.timeoutMs = timeoutMs;
    return o;
}

void test_service_label(void) {
    char out[32];
    mdnsServiceLabel("_googlecast._tcp.local", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("Googlecast", out);
    mdnsServiceLabel("_spotify-connect._tcp.local", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("Spotify-connect", out);
}

void test_infer_manufacturer(void) {
    TEST_ASSERT_EQUAL_STRING("Google", inferManufacturer("_googlecast._tcp.local"));
    TEST_ASSERT_EQUAL_STRING("Apple", inferManufacturer("_airplay._tcp.local"));
    TEST_ASSERT_EQUAL_STRING("Spotify", inferManufacturer("_spotify-connect._tcp.local"));
    TEST_ASSERT_EQUAL_STRING("DLNA", inferManufacturer("_dlna-wss._tcp.local"));
    TEST_ASSERT_EQUAL_STRING("Unknown", inferManufacturer("_ipp._tcp.local"));
}

void test_start_browses_first_service(void) {
    FakeTransport t;
    MdnsDiscovery mdns(t);
    TEST_ASSERT_TRUE(mdns.start(sessionOptions(15000), 0));

    TEST_ASSERT_EQUAL_INT(1, (int)t.sent.size());
    TEST_ASSERT_EQUAL_STRING("224.0.0.251", t.sent[0].toIp.c_str());
    TEST_ASSERT_EQUAL_UINT16(5353, t.sent[0].toPort);
    TEST_ASSERT_EQUAL_INT(1, t.countSent(DnsBuilder::encodeName("_googlecast._tcp.local")));
}

void test_complete_answer_emits_device(void) {
    FakeTransport t;
    RecordingSink sink;
    MdnsDiscovery mdns(t);
    mdns.setSink(&sink);
    mdns.start(sessionOptions(15000), 0);

    t.queueUdp(5353, "192.168.1.60", DnsBuilder()
        .ptr("_googlecast._tcp.local", CAST_INSTANCE)
        .srv(CAST_INSTANCE, 8009, "7f3a-cast.local")
        .txt(CAST_INSTANCE, {"id=7f3a", "fn=Bedroom TV", "md=Chromecast Ultra"})
        .a("7f3a-cast.local", 192, 168, 1, 60)
        .bytes());
    mdns.poll(20);

    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    const DiscoveredDevice& d = sink.devices[0];
    TEST_ASSERT_EQUAL_STRING("192.168.1.60", d.address);
    TEST_ASSERT_EQUAL_STRING("Bedroom TV", d.displayName);
    TEST_ASSERT_EQUAL_INT((int)DiscoveryMethod::MDNS, (int)d.method);
    TEST_ASSERT_EQUAL_STRING("Google", d.manufacturer);
    TEST_ASSERT_EQUAL_STRING("Chromecast Ultra", d.modelName);
    TEST_ASSERT_EQUAL_STRING("Googlecast", d.serviceType);
    TEST_ASSERT_EQUAL_UINT16(8009, d.port);
}

void test_txt_manufacturer_wins_over_inferred(void) {
    FakeTransport t;
    RecordingSink sink;
    MdnsDiscovery mdns(t);
    mdns.setSink(&sink);
    mdns.start(sessionOptions(15000), 0);

    t.queueUdp(5353, "192.168.1.61", DnsBuilder()
        .ptr("_googlecast._tcp.local", CAST_INSTANCE)
        .srv(CAST_INSTANCE, 8009, "tv.local")
        .txt(CAST_INSTANCE, {"fn=Salon", "ma=TCL"})
        .a("tv.local", 192, 168, 1, 61)
        .bytes());
    mdns.poll(20);

    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_STRING("TCL", sink.devices[0].manufacturer);
}

void test_missing_txt_waits_for_window_end(void) {
    FakeTransport t;
    RecordingSink sink;
    MdnsDiscovery mdns(t);
    mdns.setSink(&sink);
    mdns.start(sessionOptions(15000), 0);

    t.queueUdp(5353, "192.168.1.62", DnsBuilder()
        .ptr("_googlecast._tcp.local", CAST_INSTANCE)
        .srv(CAST_INSTANCE, 8009, "Living-Room.local")
        .a("Living-Room.local", 192, 168, 1, 62)
        .bytes());
    mdns.poll(20);
    TEST_ASSERT_EQUAL_INT(0, (int)sink.devices.size());

    mdns.poll(1500);
    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_STRING("Living-Room", sink.devices[0].displayName);
    TEST_ASSERT_EQUAL_STRING("", sink.devices[0].modelName);
}

void test_unresolved_instance_gets_follow_ups(void) {
    FakeTransport t;
    MdnsDiscovery mdns(t);
    mdns.start(sessionOptions(15000), 0);

    t.queueUdp(5353, "192.168.1.63", DnsBuilder()
        .ptr("_googlecast._tcp.local", CAST_INSTANCE)
        .bytes());
    mdns.poll(20);
    TEST_ASSERT_EQUAL_INT(1, (int)t.sent.size());
    TEST_ASSERT_EQUAL_INT(1, mdns.instanceCount());

    mdns.poll(300);
    // SRV and TXT for the instance
    TEST_ASSERT_EQUAL_INT(3, (int)t.sent.size());
    TEST_ASSERT_EQUAL_INT(2, t.countSent(DnsBuilder::encodeName(CAST_INSTANCE)));
}

void test_follow_ups_are_bounded(void) {
    FakeTransport t;
    MdnsDiscovery mdns(t);
    mdns.start(sessionOptions(15000), 0);

    t.queueUdp(5353, "192.168.1.63", DnsBuilder()
        .ptr("_googlecast._tcp.local", CAST_INSTANCE)
        .bytes());
    for (unsigned long now = 20; now < 1400; now += 50) mdns.poll(now);

    TEST_ASSERT_EQUAL_INT(2 * MDNS_MAX_FOLLOW_UPS,
                          t.countSent(DnsBuilder::encodeName(CAST_INSTANCE)));
}

void test_windows_advance_through_services(void) {
    FakeTransport t;
    RecordingSink sink;
    MdnsDiscovery mdns(t);
    mdns.setSink(&sink);
    mdns.start(sessionOptions(15000), 0);

    mdns.poll(1500);
    TEST_ASSERT_EQUAL_INT(1, t.countSent(DnsBuilder::encodeName("_airplay._tcp.local")));
    mdns.poll(3000);
    TEST_ASSERT_EQUAL_INT(1, t.countSent(DnsBuilder::encodeName("_spotify-connect._tcp.local")));
    mdns.poll(4500);
    TEST_ASSERT_EQUAL_INT(1, t.countSent(DnsBuilder::encodeName("_dlna-wss._tcp.local")));
    mdns.poll(6000);
    TEST_ASSERT_EQUAL_INT(4, (int)t.sent.size());

    // Idles after the last window until the session timeout
    mdns.poll(9000);
    TEST_ASSERT_TRUE(mdns.isActive());
    mdns.poll(15000);
    TEST_ASSERT_FALSE(mdns.isActive());
    TEST_ASSERT_EQUAL_INT(1, sink.completions);
    TEST_ASSERT_EQUAL_INT(0, t.openHandles());
}

void test_late_answer_after_windows_still_emitted(void) {
    FakeTransport t;
    RecordingSink sink;
    MdnsDiscovery mdns(t);
    mdns.setSink(&sink);
    mdns.start(sessionOptions(15000), 0);
    for (unsigned long now = 1500; now <= 6000; now += 1500) mdns.poll(now);

    t.queueUdp(5353, "192.168.1.64", DnsBuilder()
        .ptr("_airplay._tcp.local", "Apple TV._airplay._tcp.local")
        .srv("Apple TV._airplay._tcp.local", 7000, "Apple-TV.local")
        .a("Apple-TV.local", 192, 168, 1, 64)
        .bytes());
    mdns.poll(7000);

    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_STRING("Apple", sink.devices[0].manufacturer);
    TEST_ASSERT_EQUAL_STRING("Airplay", sink.devices[0].serviceType);
}

void test_unknown_service_and_queries_ignored(void) {
    FakeTransport t;
    RecordingSink sink;
    MdnsDiscovery mdns(t);
    mdns.setSink(&sink);
    mdns.start(sessionOptions(15000), 0);

    t.queueUdp(5353, "192.168.1.65", DnsBuilder()
        .ptr("_ipp._tcp.local", "Printer._ipp._tcp.local")
        .bytes());
    t.queueUdp(5353, "192.168.1.66", DnsBuilder(0x0000)
        .ptr("_googlecast._tcp.local", CAST_INSTANCE)
        .bytes());
    mdns.poll(20);

    TEST_ASSERT_EQUAL_INT(0, mdns.instanceCount());
    TEST_ASSERT_EQUAL_INT(0, (int)sink.errors.size());
}

void test_each_instance_emitted_once(void) {
    FakeTransport t;
    RecordingSink sink;
    MdnsDiscovery mdns(t);
    mdns.setSink(&sink);
    mdns.start(sessionOptions(15000), 0);

    std::string answer = DnsBuilder()
        .ptr("_googlecast._tcp.local", CAST_INSTANCE)
        .srv(CAST_INSTANCE, 8009, "cast.local")
        .txt(CAST_INSTANCE, {"fn=Den"})
        .a("cast.local", 192, 168, 1, 67)
        .bytes();
    t.queueUdp(5353, "192.168.1.67", answer);
    mdns.poll(20);
    t.queueUdp(5353, "192.168.1.67", answer);
    mdns.poll(40);
    mdns.poll(1500);

    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
}

void test_socket_failure(void) {
    FakeTransport t;
    t.udpOpenFails = true;
    RecordingSink sink;
    MdnsDiscovery mdns(t);
    mdns.setSink(&sink);

    TEST_ASSERT_FALSE(mdns.start(sessionOptions(15000), 0));
    TEST_ASSERT_EQUAL_INT((int)DiscoveryError::TRANSPORT, (int)sink.errors[0].error);
    TEST_ASSERT_EQUAL_INT(1, sink.completions);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_service_label);
    RUN_TEST(test_infer_manufacturer);
    RUN_TEST(test_start_browses_first_service);
    RUN_TEST(test_complete_answer_emits_device);
    RUN_TEST(test_txt_manufacturer_wins_over_inferred);
    RUN_TEST(test_missing_txt_waits_for_window_end);
    RUN_TEST(test_unresolved_instance_gets_follow_ups);
    RUN_TEST(test_follow_ups_are_bounded);
    RUN_TEST(test_windows_advance_through_services);
    RUN_TEST(test_late_answer_after_windows_still_emitted);
    RUN_TEST(test_unknown_service_and_queries_ignored);
    RUN_TEST(test_each_instance_emitted_once);
    RUN_TEST(test_socket_failure);
    return UNITY_END();
}
