#include "code_payload.h"
#include "../util/text.h"
#include <cstring>

namespace tvscout {

const char* codePayloadErrorToString(CodePayloadError error) {
    switch (error) {
        case CodePayloadError::NONE:            return "none";
        case CodePayloadError::NOT_JSON:        return "not a JSON object";
        case CodePayloadError::MISSING_VERSION: return "missing or invalid field \"v\"";
        case CodePayloadError::INVALID_ADDRESS: return "missing or invalid field \"ip\"";
        case CodePayloadError::INVALID_PORT:    return "missing or invalid field \"port\"";
        case CodePayloadError::MISSING_NAME:    return "missing or invalid field \"name\"";
        case CodePayloadError::WRONG_TYPE:      return "optional field has the wrong type";
        default:                                return "unknown";
    }
}

// Optional string: absent or null is fine, anything else must be a string
static bool readOptional(JsonObjectConst obj, const char* key, char* field, size_t fieldLen) {
    field[0] = '\0';
    JsonVariantConst v = obj[key];
    if (v.isNull()) return true;
    if (!v.is<const char*>()) return false;
    copyString(field, fieldLen, v.as<const char*>());
    return true;
}

CodePayloadError decodeCodePayload(JsonObjectConst obj, CodePayload& payload) {
    memset(&payload, 0, sizeof(payload));
    if (obj.isNull()) return CodePayloadError::NOT_JSON;

    if (!obj["v"].is<int>()) return CodePayloadError::MISSING_VERSION;

    if (!obj["ip"].is<const char*>()) return CodePayloadError::INVALID_ADDRESS;
    const char* ip = obj["ip"].as<const char*>();
    if (!isValidIpv4(ip)) return CodePayloadError::INVALID_ADDRESS;

    if (!obj["port"].is<long>()) return CodePayloadError::INVALID_PORT;
    long port = obj["port"].as<long>();
    if (port <= 0 || port > 65535) return CodePayloadError::INVALID_PORT;

    if (!obj["name"].is<const char*>()) return CodePayloadError::MISSING_NAME;
    const char* name = obj["name"].as<const char*>();
    if (name[0] == '\0') return CodePayloadError::MISSING_NAME;

    if (!readOptional(obj, "manufacturer", payload.manufacturer, sizeof(payload.manufacturer)) ||
        !readOptional(obj, "model", payload.model, sizeof(payload.model)) ||
        !readOptional(obj, "protocol", payload.protocol, sizeof(payload.protocol))) {
        return CodePayloadError::WRONG_TYPE;
    }

    payload.version = obj["v"].as<int>();
    copyString(payload.ip, sizeof(payload.ip), ip);
    payload.port = (uint16_t)port;
    copyString(payload.name, sizeof(payload.name), name);
    return CodePayloadError::NONE;
}

CodePayloadError parseCodePayload(const char* raw, CodePayload& payload) {
    memset(&payload, 0, sizeof(payload));
    if (raw == nullptr) return CodePayloadError::NOT_JSON;

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, raw);
    if (err) return CodePayloadError::NOT_JSON;
    if (!doc.is<JsonObjectConst>()) return CodePayloadError::NOT_JSON;

    return decodeCodePayload(doc.as<JsonObjectConst>(), payload);
}

bool encodeCodePayload(JsonDocument& doc, const CodePayload& payload) {
    JsonObject obj = doc.to<JsonObject>();

    obj["v"] = payload.version;
    obj["ip"] = payload.ip;
    obj["port"] = payload.port;
    obj["name"] = payload.name;

    if (payload.manufacturer[0] != '\0') obj["manufacturer"] = payload.manufacturer;
    if (payload.model[0] != '\0') obj["model"] = payload.model;
    if (payload.protocol[0] != '\0') obj["protocol"] = payload.protocol;

    return true;
}

int serializeCodePayload(const CodePayload& payload, char* output, size_t outputLen) {
    JsonDocument doc;
    encodeCodePayload(doc, payload);
    if (measureJson(doc) >= outputLen) return -1;
    return (int)serializeJson(doc, output, outputLen);
}

void codePayloadToDevice(const CodePayload& payload, DiscoveredDevice& device) {
    initDevice(device);
    setField(device.address, sizeof(device.address), payload.ip);
    setField(device.displayName, sizeof(device.displayName), payload.name);
    device.method = DiscoveryMethod::CODE_SCAN;
    device.port = payload.port;
    setField(device.manufacturer, sizeof(device.manufacturer), payload.manufacturer);
    setField(device.modelName, sizeof(device.modelName), payload.model);
    setField(device.serviceType, sizeof(device.serviceType), payload.protocol);
}

} // namespace tvscout
