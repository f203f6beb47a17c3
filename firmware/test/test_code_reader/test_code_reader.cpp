#include <unity.h>
#include <cstring>
#include "discovery/code_reader.h"
#include "support/recording_sink.h"

using namespace tvscout;

void setUp(void) {}
void tearDown(void) {}

static const char* GOOD_CODE =
    "{\"v\":1,\"ip\":\"192.168.1.42\",\"port\":8080,\"name\":\"Living Room TV\",\"protocol\":\"android_tv\"}";

static DiscoveryOptions waitingOptions() {
    DiscoveryOptions o;
    initOptions(o);
    return o;
}

void test_submit_without_session(void) {
    CodeReader reader;
    TEST_ASSERT_EQUAL_INT((int)SubmitResult::INACTIVE, (int)reader.submit(GOOD_CODE));
}

void test_valid_code_emits_once_and_ends(void) {
    RecordingSink sink;
    CodeReader reader;
    reader.setSink(&sink);
    TEST_ASSERT_TRUE(reader.start(waitingOptions(), 0));

    TEST_ASSERT_EQUAL_INT((int)SubmitResult::ACCEPTED, (int)reader.submit(GOOD_CODE));
    TEST_ASSERT_FALSE(reader.isActive());
    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_STRING("Living Room TV", sink.devices[0].displayName);
    TEST_ASSERT_EQUAL_STRING("android_tv", sink.devices[0].serviceType);
    TEST_ASSERT_EQUAL_INT(1, sink.completions);

    TEST_ASSERT_EQUAL_INT((int)SubmitResult::INACTIVE, (int)reader.submit(GOOD_CODE));
    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
}

void test_foreign_codes_keep_scanning(void) {
    RecordingSink sink;
    CodeReader reader;
    reader.setSink(&sink);
    reader.start(waitingOptions(), 0);

    TEST_ASSERT_EQUAL_INT((int)SubmitResult::IGNORED, (int)reader.submit("WIFI:S:home;T:WPA;P:x;;"));
    TEST_ASSERT_EQUAL_INT((int)SubmitResult::IGNORED, (int)reader.submit("https://example.com"));
    TEST_ASSERT_TRUE(reader.isActive());
    TEST_ASSERT_EQUAL_INT(0, (int)sink.errors.size());

    TEST_ASSERT_EQUAL_INT((int)SubmitResult::ACCEPTED, (int)reader.submit(GOOD_CODE));
}

void test_invalid_code_ends_with_validation_error(void) {
    RecordingSink sink;
    CodeReader reader;
    reader.setSink(&sink);
    reader.start(waitingOptions(), 0);

    SubmitResult r = reader.submit("{\"v\":1,\"ip\":\"192.168.1.42\",\"port\":70000,\"name\":\"TV\"}");
    TEST_ASSERT_EQUAL_INT((int)SubmitResult::REJECTED, (int)r);
    TEST_ASSERT_FALSE(reader.isActive());
    TEST_ASSERT_EQUAL_INT(0, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_INT(1, (int)sink.errors.size());
    TEST_ASSERT_EQUAL_INT((int)DiscoveryError::VALIDATION, (int)sink.errors[0].error);
    TEST_ASSERT_NOT_NULL(strstr(sink.errors[0].message.c_str(), "port"));
    TEST_ASSERT_EQUAL_INT(1, sink.completions);
}

void test_code_from_options_delivered_on_poll(void) {
    RecordingSink sink;
    CodeReader reader;
    reader.setSink(&sink);

    DiscoveryOptions o = waitingOptions();
    strcpy(o.codePayload, GOOD_CODE);
    reader.start(o, 0);
    TEST_ASSERT_EQUAL_INT(0, (int)sink.devices.size());

    reader.poll(5);
    TEST_ASSERT_EQUAL_INT(1, (int)sink.devices.size());
    TEST_ASSERT_FALSE(reader.isActive());
}

void test_stop_discards_pending_code(void) {
    RecordingSink sink;
    CodeReader reader;
    reader.setSink(&sink);

    DiscoveryOptions o = waitingOptions();
    strcpy(o.codePayload, GOOD_CODE);
    reader.start(o, 0);
    reader.stop();
    reader.poll(5);

    TEST_ASSERT_EQUAL_INT(0, (int)sink.devices.size());
    TEST_ASSERT_EQUAL_INT(1, sink.completions);
}

void test_session_timeout_without_code(void) {
    RecordingSink sink;
    CodeReader reader;
    reader.setSink(&sink);

    DiscoveryOptions o = waitingOptions();
    o.timeoutMs = 30000;
    reader.start(o, 0);
    reader.poll(29999);
    TEST_ASSERT_TRUE(reader.isActive());
    reader.poll(30000);
    TEST_ASSERT_FALSE(reader.isActive());
    TEST_ASSERT_EQUAL_INT(0, (int)sink.errors.size());
    TEST_ASSERT_EQUAL_INT(1, sink.completions);
}

void test_submit_result_names(void) {
    TEST_ASSERT_EQUAL_STRING("accepted", submitResultToString(SubmitResult::ACCEPTED));
    TEST_ASSERT_EQUAL_STRING("ignored", submitResultToString(SubmitResult::IGNORED));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_submit_without_session);
    RUN_TEST(test_valid_code_emits_once_and_ends);
    RUN_TEST(test_foreign_codes_keep_scanning);
    RUN_TEST(test_invalid_code_ends_with_validation_error);
    RUN_TEST(test_code_from_options_delivered_on_poll);
    RUN_TEST(test_stop_discards_pending_code);
    RUN_TEST(test_session_timeout_without_code);
    RUN_TEST(test_submit_result_names);
    return UNITY_END();
}
