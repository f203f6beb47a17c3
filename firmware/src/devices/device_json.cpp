#include "device_json.h"

namespace tvscout {

static void putOptional(JsonObject obj, const char* key, const char* value) {
    if (value[0] != '\0') {
        obj[key] = value;
    } else {
        obj[key] = nullptr;
    }
}

static void getOptional(JsonObjectConst obj, const char* key, char* field, size_t fieldLen) {
    if (obj[key].is<const char*>()) {
        setField(field, fieldLen, obj[key].as<const char*>());
    }
}

bool deviceToJson(JsonDocument& doc, const DiscoveredDevice& device) {
    JsonObject obj = doc.to<JsonObject>();

    obj["ip"] = device.address;
    obj["friendlyName"] = device.displayName;
    obj["method"] = discoveryMethodToString(device.method);
    putOptional(obj, "location", device.location);
    putOptional(obj, "serviceType", device.serviceType);
    putOptional(obj, "manufacturer", device.manufacturer);
    putOptional(obj, "modelName", device.modelName);
    if (device.port != 0) {
        obj["port"] = device.port;
    } else {
        obj["port"] = nullptr;
    }
    putOptional(obj, "ssid", device.networkName);
    putOptional(obj, "customName", device.customName);
    obj["addedAt"] = device.firstSeenMs;
    if (device.brandDetected) {
        obj["detectedBrand"] = tvBrandToString(device.brand);
    } else {
        obj["detectedBrand"] = nullptr;
    }

    return true;
}

bool deviceFromJson(JsonObjectConst obj, DiscoveredDevice& device) {
    if (obj.isNull()) return false;
    if (!obj["ip"].is<const char*>()) return false;
    if (!obj["friendlyName"].is<const char*>()) return false;

    initDevice(device);
    setField(device.address, sizeof(device.address), obj["ip"].as<const char*>());
    setField(device.displayName, sizeof(device.displayName),
             obj["friendlyName"].as<const char*>());

    if (!discoveryMethodFromString(obj["method"].as<const char*>(), device.method)) {
        device.method = DiscoveryMethod::DIRECT_IP;
    }

    getOptional(obj, "location", device.location, sizeof(device.location));
    getOptional(obj, "serviceType", device.serviceType, sizeof(device.serviceType));
    getOptional(obj, "manufacturer", device.manufacturer, sizeof(device.manufacturer));
    getOptional(obj, "modelName", device.modelName, sizeof(device.modelName));
    getOptional(obj, "ssid", device.networkName, sizeof(device.networkName));
    getOptional(obj, "customName", device.customName, sizeof(device.customName));

    if (obj["port"].is<int>()) {
        int port = obj["port"].as<int>();
        if (port > 0 && port <= 65535) device.port = (uint16_t)port;
    }

    if (obj["addedAt"].is<unsigned long>()) {
        device.firstSeenMs = obj["addedAt"].as<unsigned long>();
    }

    if (obj["detectedBrand"].is<const char*>()) {
        if (!tvBrandFromString(obj["detectedBrand"].as<const char*>(), device.brand)) {
            device.brand = TvBrand::UNKNOWN;
        }
        device.brandDetected = true;
    }

    return true;
}

} // namespace tvscout
