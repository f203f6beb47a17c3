#pragma once
#include <ArduinoJson.h>
#include "../devices/discovered_device.h"

namespace tvscout {

// JSON carried by the code a TV app shows on screen:
// {"v":1,"ip":"192.168.1.42","port":8080,"name":"Living Room TV",
//  "manufacturer":"Samsung","model":"QN85A","protocol":"samsung_tizen"}
// Unknown keys are ignored so newer TV apps stay readable.

static const int CODE_PAYLOAD_VERSION = 1;

enum class CodePayloadError : uint8_t {
    NONE            = 0,
    NOT_JSON        = 1,  // not a JSON object at all: some other code
    MISSING_VERSION = 2,  // "v" absent or not an integer
    INVALID_ADDRESS = 3,  // "ip" absent or not a dotted quad
    INVALID_PORT    = 4,  // "port" absent, not an integer, or out of range
    MISSING_NAME    = 5,  // "name" absent or empty
    WRONG_TYPE      = 6   // optional field present with a non-string value
};

struct CodePayload {
    int version;
    char ip[ADDRESS_LEN];
    uint16_t port;
    char name[NAME_LEN];
    char manufacturer[FIELD_LEN];
    char model[FIELD_LEN];
    char protocol[FIELD_LEN];  // remote protocol hint, e.g. "android_tv"
};

const char* codePayloadErrorToString(CodePayloadError error);

// Validate fields of an already-parsed object
CodePayloadError decodeCodePayload(JsonObjectConst obj, CodePayload& payload);

// Parse raw scanned text. NOT_JSON for anything that is not a JSON object.
CodePayloadError parseCodePayload(const char* raw, CodePayload& payload);

// Write payload into doc; optional fields only when set
bool encodeCodePayload(JsonDocument& doc, const CodePayload& payload);

// Serialized form, as a TV app would put it in the code.
// Returns length, or -1 if the buffer is too small.
int serializeCodePayload(const CodePayload& payload, char* output, size_t outputLen);

// The protocol hint becomes the service type
void codePayloadToDevice(const CodePayload& payload, DiscoveredDevice& device);

} // namespace tvscout
