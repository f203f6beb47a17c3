#include <unity.h>
#include <cstring>
#include "protocols/xml_fields.h"

using namespace tvscout;

void setUp(void) {}
void tearDown(void) {}

static const char* DESCRIPTION =
    "<?xml version=\"1.0\"?>\n"
    "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
    "  <specVersion><major>1</major></specVersion>\n"
    "  <device>\n"
    "    <deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>\n"
    "    <friendlyName> [TV] Samsung Q70 &amp; Co </friendlyName>\n"
    "    <manufacturer>Samsung Electronics</manufacturer>\n"
    "    <modelName>QE55Q70R</modelName>\n"
    "  </device>\n"
    "</root>\n";

void test_extract_element_trims_and_decodes(void) {
    char out[64];
    TEST_ASSERT_TRUE(extractXmlElement(DESCRIPTION, "friendlyName", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("[TV] Samsung Q70 & Co", out);
}

void test_extract_element_with_prefix_and_attributes(void) {
    const char* xml = "<dlna:X_DLNADOC xmlns:dlna=\"urn:x\">DMR-1.50</dlna:X_DLNADOC>";
    char out[32];
    TEST_ASSERT_TRUE(extractXmlElement(xml, "X_DLNADOC", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("DMR-1.50", out);
}

void test_extract_element_does_not_match_longer_tag(void) {
    const char* xml = "<modelNameExtra>x</modelNameExtra><modelName>Real</modelName>";
    char out[32];
    TEST_ASSERT_TRUE(extractXmlElement(xml, "modelName", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("Real", out);
}

void test_extract_missing_or_empty(void) {
    char out[32];
    TEST_ASSERT_FALSE(extractXmlElement(DESCRIPTION, "serialNumber", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("", out);
    TEST_ASSERT_FALSE(extractXmlElement("<a><b/></a>", "b", out, sizeof(out)));
    TEST_ASSERT_FALSE(extractXmlElement("<b>   </b>", "b", out, sizeof(out)));
    TEST_ASSERT_FALSE(extractXmlElement(nullptr, "b", out, sizeof(out)));
}

void test_replace_entities(void) {
    char s[64];
    strcpy(s, "&lt;a&gt; &quot;b&quot; &apos;c&apos; &amp;lt;");
    replaceXmlEntities(s);
    TEST_ASSERT_EQUAL_STRING("<a> \"b\" 'c' &lt;", s);
}

void test_parse_description(void) {
    DeviceDescription info;
    TEST_ASSERT_TRUE(parseDeviceDescription(DESCRIPTION, info));
    TEST_ASSERT_EQUAL_STRING("Samsung Electronics", info.manufacturer);
    TEST_ASSERT_EQUAL_STRING("QE55Q70R", info.modelName);
    TEST_ASSERT_EQUAL_STRING("urn:schemas-upnp-org:device:MediaRenderer:1", info.deviceType);
}

void test_parse_description_without_fields(void) {
    DeviceDescription info;
    TEST_ASSERT_FALSE(parseDeviceDescription("<html><body>hi</body></html>", info));
    TEST_ASSERT_EQUAL_STRING("", info.friendlyName);
    TEST_ASSERT_FALSE(parseDeviceDescription(nullptr, info));
}

void test_short_service_type(void) {
    char out[48];
    shortServiceType("urn:schemas-upnp-org:device:MediaRenderer:1", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("MediaRenderer", out);

    shortServiceType("urn:dial-multiscreen-org:service:dial:1", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("dial", out);

    shortServiceType("JointSpace TV", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("JointSpace TV", out);

    shortServiceType(nullptr, out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("", out);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_extract_element_trims_and_decodes);
    RUN_TEST(test_extract_element_with_prefix_and_attributes);
    RUN_TEST(test_extract_element_does_not_match_longer_tag);
    RUN_TEST(test_extract_missing_or_empty);
    RUN_TEST(test_replace_entities);
    RUN_TEST(test_parse_description);
    RUN_TEST(test_parse_description_without_fields);
    RUN_TEST(test_short_service_type);
    return UNITY_END();
}
