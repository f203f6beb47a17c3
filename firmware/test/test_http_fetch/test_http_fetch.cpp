#include <unity.h>
#include <cstring>
#include <string>
#include "network/http_fetch.h"
#include "support/fake_transport.h"

using namespace tvscout;

void setUp(void) {}
void tearDown(void) {}

// --- parseUrl ---

void test_parse_url_with_port_and_path(void) {
    UrlParts p;
    TEST_ASSERT_TRUE(parseUrl("http://192.168.1.40:9197/dmr", p));
    TEST_ASSERT_FALSE(p.https);
    TEST_ASSERT_EQUAL_STRING("192.168.1.40", p.host);
    TEST_ASSERT_EQUAL_UINT16(9197, p.port);
    TEST_ASSERT_EQUAL_STRING("/dmr", p.path);
}

void test_parse_url_defaults(void) {
    UrlParts p;
    TEST_ASSERT_TRUE(parseUrl("https://10.0.0.5", p));
    TEST_ASSERT_TRUE(p.https);
    TEST_ASSERT_EQUAL_UINT16(443, p.port);
    TEST_ASSERT_EQUAL_STRING("/", p.path);

    TEST_ASSERT_TRUE(parseUrl("http://10.0.0.5/desc.xml", p));
    TEST_ASSERT_EQUAL_UINT16(80, p.port);
}

void test_parse_url_rejects_garbage(void) {
    UrlParts p;
    TEST_ASSERT_FALSE(parseUrl("ftp://10.0.0.5/", p));
    TEST_ASSERT_FALSE(parseUrl("http://:80/", p));
    TEST_ASSERT_FALSE(parseUrl("http://10.0.0.5:99999/", p));
    TEST_ASSERT_FALSE(parseUrl("http://10.0.0.5:/x", p));
    TEST_ASSERT_FALSE(parseUrl(nullptr, p));
}

// --- HttpFetch against the fake transport ---

void test_fetch_success(void) {
    FakeTransport t;
    t.addHttp("10.0.0.5", 8008, "/ssdp/device-desc.xml", 200, "<root/>");

    HttpFetch fetch(t);
    TEST_ASSERT_TRUE(fetch.begin("http://10.0.0.5:8008/ssdp/device-desc.xml", 2000, 0));
    TEST_ASSERT_TRUE(fetch.busy());

    FetchResult r = fetch.poll(10);
    TEST_ASSERT_EQUAL_INT((int)FetchResult::DONE, (int)r);
    TEST_ASSERT_EQUAL_INT(200, fetch.status());
    TEST_ASSERT_EQUAL_STRING("<root/>", fetch.body());
    TEST_ASSERT_EQUAL_INT(0, t.openHandles());
}

void test_fetch_not_found_is_done_with_status(void) {
    FakeTransport t;
    t.addHttp("10.0.0.5", 80, "/other", 200, "x");

    HttpFetch fetch(t);
    fetch.begin("http://10.0.0.5/description.xml", 2000, 0);
    TEST_ASSERT_EQUAL_INT((int)FetchResult::DONE, (int)fetch.poll(1));
    TEST_ASSERT_EQUAL_INT(404, fetch.status());
    TEST_ASSERT_EQUAL_STRING("", fetch.body());
}

void test_fetch_connection_refused(void) {
    FakeTransport t;
    HttpFetch fetch(t);
    fetch.begin("http://10.0.0.9:1925/1/system", 2000, 0);
    TEST_ASSERT_EQUAL_INT((int)FetchResult::FAILED, (int)fetch.poll(1));
    TEST_ASSERT_FALSE(fetch.timedOut());
    TEST_ASSERT_EQUAL_INT(0, t.openHandles());
}

void test_fetch_timeout(void) {
    FakeTransport t;
    t.endpoint("10.0.0.7", 80, FakeTransport::Connect::HANG);

    HttpFetch fetch(t);
    fetch.begin("http://10.0.0.7/", 2000, 100);
    TEST_ASSERT_EQUAL_INT((int)FetchResult::PENDING, (int)fetch.poll(1000));
    TEST_ASSERT_EQUAL_INT((int)FetchResult::FAILED, (int)fetch.poll(2100));
    TEST_ASSERT_TRUE(fetch.timedOut());
    TEST_ASSERT_EQUAL_INT(0, t.openHandles());
}

void test_fetch_https_uses_tls(void) {
    FakeTransport t;
    t.addHttp("10.0.0.5", 1926, "/6/system", 200, "{}");

    HttpFetch fetch(t);
    fetch.begin("https://10.0.0.5:1926/6/system", 2000, 0);
    TEST_ASSERT_EQUAL_INT((int)FetchResult::DONE, (int)fetch.poll(1));
    TEST_ASSERT_EQUAL_INT(1, (int)t.tlsConnects.size());
    TEST_ASSERT_EQUAL_STRING("{}", fetch.body());
}

void test_fetch_passes_full_url_to_client(void) {
    FakeTransport t;
    t.addHttp("10.0.0.5", 8060, "/query/device-info", 200, "<device-info/>");

    HttpFetch fetch(t);
    fetch.begin("http://10.0.0.5:8060/query/device-info", 2000, 0);
    fetch.poll(1);
    TEST_ASSERT_EQUAL_INT(1, (int)t.httpUrls.size());
    TEST_ASSERT_EQUAL_STRING("http://10.0.0.5:8060/query/device-info", t.httpUrls[0].c_str());
    TEST_ASSERT_EQUAL_INT(0, (int)t.tlsConnects.size());
    TEST_ASSERT_EQUAL_STRING("http://10.0.0.5:8060/query/device-info", fetch.url());
}

void test_fetch_oversized_body_is_cut(void) {
    FakeTransport t;
    std::string big(HTTP_BUFFER_SIZE + 100, 'x');
    t.addHttp("10.0.0.5", 80, "/big.xml", 200, big);

    HttpFetch fetch(t);
    fetch.begin("http://10.0.0.5/big.xml", 2000, 0);
    TEST_ASSERT_EQUAL_INT((int)FetchResult::DONE, (int)fetch.poll(1));
    TEST_ASSERT_EQUAL_INT(HTTP_BUFFER_SIZE - 1, (int)fetch.bodyLength());
    TEST_ASSERT_EQUAL_INT(HTTP_BUFFER_SIZE - 1, (int)strlen(fetch.body()));
}

void test_fetch_no_request_slot(void) {
    FakeTransport t;
    t.setMaxHandles(0);
    HttpFetch fetch(t);
    TEST_ASSERT_FALSE(fetch.begin("http://10.0.0.5/", 2000, 0));
    TEST_ASSERT_FALSE(fetch.busy());
    TEST_ASSERT_EQUAL_INT((int)FetchResult::FAILED, (int)fetch.poll(1));
}

void test_fetch_cancel_releases_socket(void) {
    FakeTransport t;
    t.endpoint("10.0.0.7", 80, FakeTransport::Connect::HANG);

    HttpFetch fetch(t);
    fetch.begin("http://10.0.0.7/", 2000, 0);
    TEST_ASSERT_EQUAL_INT(1, t.openHandles());
    fetch.cancel();
    TEST_ASSERT_EQUAL_INT(0, t.openHandles());
    TEST_ASSERT_FALSE(fetch.busy());
}

void test_fetch_bad_url(void) {
    FakeTransport t;
    HttpFetch fetch(t);
    TEST_ASSERT_FALSE(fetch.begin("not a url", 2000, 0));
    TEST_ASSERT_EQUAL_INT((int)FetchResult::FAILED, (int)fetch.poll(1));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_parse_url_with_port_and_path);
    RUN_TEST(test_parse_url_defaults);
    RUN_TEST(test_parse_url_rejects_garbage);
    RUN_TEST(test_fetch_success);
    RUN_TEST(test_fetch_not_found_is_done_with_status);
    RUN_TEST(test_fetch_connection_refused);
    RUN_TEST(test_fetch_timeout);
    RUN_TEST(test_fetch_https_uses_tls);
    RUN_TEST(test_fetch_passes_full_url_to_client);
    RUN_TEST(test_fetch_oversized_body_is_cut);
    RUN_TEST(test_fetch_no_request_slot);
    RUN_TEST(test_fetch_cancel_releases_socket);
    RUN_TEST(test_fetch_bad_url);
    return UNITY_END();
}
