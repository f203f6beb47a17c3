#pragma once
#include <cstddef>
#include <cstdint>

namespace tvscout {

// How a device record was produced. Order is not the authority rank,
// see authorityRank().
enum class DiscoveryMethod : uint8_t {
    SSDP       = 0,  // multicast M-SEARCH + UPnP description
    MDNS       = 1,  // multicast DNS service browse
    PORT_PROBE = 2,  // TCP sweep of the local /24
    DIRECT_IP  = 3,  // single address typed by the user
    CODE_SCAN  = 4   // payload captured from a code on the TV screen
};

enum class DeviceType : uint8_t {
    TV      = 0,
    SPEAKER = 1,
    MODEM   = 2,
    OTHER   = 3
};

enum class TvBrand : uint8_t {
    SAMSUNG   = 0,
    LG        = 1,
    SONY      = 2,
    PHILIPS   = 3,
    HISENSE   = 4,
    TCL       = 5,
    PANASONIC = 6,
    SHARP     = 7,
    TOSHIBA   = 8,
    GOOGLE    = 9,
    AMAZON    = 10,
    APPLE     = 11,
    ROKU      = 12,
    TORIMA    = 13,
    UNKNOWN   = 14
};

static const size_t ADDRESS_LEN      = 16;   // "255.255.255.255"
static const size_t NAME_LEN         = 64;
static const size_t LOCATION_LEN     = 128;
static const size_t FIELD_LEN        = 48;
static const size_t NETWORK_NAME_LEN = 33;   // 32-byte SSID + null
static const size_t HEADER_KEY_LEN   = 16;
static const size_t HEADER_VALUE_LEN = 128;
static const int MAX_PROTOCOL_HEADERS = 6;

struct ProtocolHeader {
    char key[HEADER_KEY_LEN];      // upper-case, e.g. "ST", "USN", "SERVER"
    char value[HEADER_VALUE_LEN];
};

// One sighting of a device. Empty strings and port 0 mean "not known".
struct DiscoveredDevice {
    char address[ADDRESS_LEN];
    char displayName[NAME_LEN];
    DiscoveryMethod method;

    char location[LOCATION_LEN];
    char serviceType[FIELD_LEN];
    char manufacturer[FIELD_LEN];
    char modelName[FIELD_LEN];
    uint16_t port;

    ProtocolHeader headers[MAX_PROTOCOL_HEADERS];
    int headerCount;

    char networkName[NETWORK_NAME_LEN];
    char customName[NAME_LEN];
    unsigned long firstSeenMs;

    TvBrand brand;
    bool brandDetected;  // false until the classifier has run
};

// Reset every field (brand UNKNOWN, not detected)
void initDevice(DiscoveredDevice& device);

// Bounded field assignment; returns false if value was truncated
bool setField(char* field, size_t fieldLen, const char* value);

// Placeholder names mark a device that is still being identified:
// anything containing "..." (or U+2026) or starting with "Identifying"
bool isPlaceholderName(const char* name);

// Higher means more trustworthy. SSDP is the authority source.
int authorityRank(DiscoveryMethod method);
bool isAuthoritySource(DiscoveryMethod method);

// Rule order: modem/gateway, then tv, then speaker, else other
DeviceType deviceType(const DiscoveredDevice& device);

// Gateways and modems are hidden from the device list
bool isControllable(const DiscoveredDevice& device);

// User override when set, otherwise the discovered name
const char* displayNameOf(const DiscoveredDevice& device);

// Protocol header access (keys compared case-insensitively).
// setHeader replaces an existing key; returns false when the table is full.
bool setHeader(DiscoveredDevice& device, const char* key, const char* value);
const char* getHeader(const DiscoveredDevice& device, const char* key);

const char* discoveryMethodToString(DiscoveryMethod method);
bool discoveryMethodFromString(const char* s, DiscoveryMethod& method);
const char* deviceTypeToString(DeviceType type);
const char* tvBrandToString(TvBrand brand);
bool tvBrandFromString(const char* s, TvBrand& brand);

} // namespace tvscout
