#include "discovered_device.h"
#include "../util/text.h"
#include <cstring>

namespace tvscout {

void initDevice(DiscoveredDevice& device) {
    memset(&device, 0, sizeof(device));
    device.method = DiscoveryMethod::DIRECT_IP;
    device.brand = TvBrand::UNKNOWN;
    device.brandDetected = false;
}

bool setField(char* field, size_t fieldLen, const char* value) {
    return copyString(field, fieldLen, value);
}

bool isPlaceholderName(const char* name) {
    if (name == nullptr) return false;
    if (strstr(name, "...") != nullptr) return true;
    if (strstr(name, "\xE2\x80\xA6") != nullptr) return true;
    return startsWith(name, "Identifying");
}

int authorityRank(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::SSDP:       return 4;
        case DiscoveryMethod::MDNS:       return 3;
        case DiscoveryMethod::DIRECT_IP:  return 2;
        case DiscoveryMethod::CODE_SCAN:  return 2;
        case DiscoveryMethod::PORT_PROBE: return 1;
        default:                          return 0;
    }
}

bool isAuthoritySource(DiscoveryMethod method) {
    return method == DiscoveryMethod::SSDP;
}

// Manufacturers that only ship gateways in the wild
static const char* GATEWAY_MANUFACTURERS[] = {
    "tp-link", "zte", "huawei", "arris", "technicolor", "sagemcom"
};
static const int NUM_GATEWAY_MANUFACTURERS =
    sizeof(GATEWAY_MANUFACTURERS) / sizeof(GATEWAY_MANUFACTURERS[0]);

static const char* GATEWAY_NAME_TOKENS[] = {
    "router", "gateway", "modem", "archer", "dsl"
};
static const int NUM_GATEWAY_NAME_TOKENS =
    sizeof(GATEWAY_NAME_TOKENS) / sizeof(GATEWAY_NAME_TOKENS[0]);

DeviceType deviceType(const DiscoveredDevice& device) {
    const char* type = device.serviceType;
    const char* name = device.displayName;
    const char* mfr = device.manufacturer;

    // Modem / router / gateway first so "Internet Home Gateway Device"
    // or router model names never land in the TV bucket
    if (containsNoCase(type, "internetgateway") ||
        containsNoCase(type, "gateway") ||
        containsNoCase(type, "wandevice")) {
        return DeviceType::MODEM;
    }
    for (int i = 0; i < NUM_GATEWAY_NAME_TOKENS; i++) {
        if (containsNoCase(name, GATEWAY_NAME_TOKENS[i])) return DeviceType::MODEM;
    }
    for (int i = 0; i < NUM_GATEWAY_MANUFACTURERS; i++) {
        if (equalsNoCase(mfr, GATEWAY_MANUFACTURERS[i])) return DeviceType::MODEM;
    }

    if (containsNoCase(type, "tv") ||
        containsNoCase(type, "renderer") ||
        containsNoCase(type, "dial") ||
        containsNoCase(type, "jointspace") ||
        containsNoCase(type, "projector") ||
        containsNoCase(name, "tv") ||
        containsNoCase(name, "chromecast") ||
        containsNoCase(name, "bravia") ||
        containsNoCase(name, "fire")) {
        return DeviceType::TV;
    }

    if (containsNoCase(type, "audio") ||
        containsNoCase(type, "speaker") ||
        containsNoCase(name, "speaker") ||
        containsNoCase(name, "soundbar") ||
        containsNoCase(name, "sonos") ||
        containsNoCase(name, "homepod")) {
        return DeviceType::SPEAKER;
    }

    return DeviceType::OTHER;
}

bool isControllable(const DiscoveredDevice& device) {
    return deviceType(device) != DeviceType::MODEM;
}

const char* displayNameOf(const DiscoveredDevice& device) {
    return device.customName[0] ? device.customName : device.displayName;
}

bool setHeader(DiscoveredDevice& device, const char* key, const char* value) {
    if (key == nullptr || key[0] == '\0' || value == nullptr) return false;

    for (int i = 0; i < device.headerCount; i++) {
        if (equalsNoCase(device.headers[i].key, key)) {
            copyString(device.headers[i].value, HEADER_VALUE_LEN, value);
            return true;
        }
    }

    if (device.headerCount >= MAX_PROTOCOL_HEADERS) return false;

    ProtocolHeader& h = device.headers[device.headerCount++];
    copyString(h.key, HEADER_KEY_LEN, key);
    toUpperInPlace(h.key);
    copyString(h.value, HEADER_VALUE_LEN, value);
    return true;
}

const char* getHeader(const DiscoveredDevice& device, const char* key) {
    for (int i = 0; i < device.headerCount; i++) {
        if (equalsNoCase(device.headers[i].key, key)) {
            return device.headers[i].value;
        }
    }
    return nullptr;
}

const char* discoveryMethodToString(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::SSDP:       return "ssdp";
        case DiscoveryMethod::MDNS:       return "mdns";
        case DiscoveryMethod::PORT_PROBE: return "networkProbe";
        case DiscoveryMethod::DIRECT_IP:  return "manualIp";
        case DiscoveryMethod::CODE_SCAN:  return "qr";
        default:                          return "unknown";
    }
}

bool discoveryMethodFromString(const char* s, DiscoveryMethod& method) {
    if (s == nullptr) return false;
    static const DiscoveryMethod ALL[] = {
        DiscoveryMethod::SSDP, DiscoveryMethod::MDNS, DiscoveryMethod::PORT_PROBE,
        DiscoveryMethod::DIRECT_IP, DiscoveryMethod::CODE_SCAN
    };
    for (size_t i = 0; i < sizeof(ALL) / sizeof(ALL[0]); i++) {
        if (strcmp(s, discoveryMethodToString(ALL[i])) == 0) {
            method = ALL[i];
            return true;
        }
    }
    return false;
}

const char* deviceTypeToString(DeviceType type) {
    switch (type) {
        case DeviceType::TV:      return "tv";
        case DeviceType::SPEAKER: return "speaker";
        case DeviceType::MODEM:   return "modem";
        case DeviceType::OTHER:   return "other";
        default:                  return "other";
    }
}

static const char* BRAND_NAMES[] = {
    "samsung", "lg", "sony", "philips", "hisense", "tcl", "panasonic",
    "sharp", "toshiba", "google", "amazon", "apple", "roku", "torima", "unknown"
};
static const int NUM_BRANDS = sizeof(BRAND_NAMES) / sizeof(BRAND_NAMES[0]);

const char* tvBrandToString(TvBrand brand) {
    int index = (int)brand;
    if (index < 0 || index >= NUM_BRANDS) return "unknown";
    return BRAND_NAMES[index];
}

bool tvBrandFromString(const char* s, TvBrand& brand) {
    if (s == nullptr) return false;
    for (int i = 0; i < NUM_BRANDS; i++) {
        if (strcmp(s, BRAND_NAMES[i]) == 0) {
            brand = (TvBrand)i;
            return true;
        }
    }
    return false;
}

} // namespace tvscout
