#include "brand_detector.h"
#include "oui_table.h"
#include "../debug_log.h"
#include "../util/text.h"
#include <cstring>

namespace tvscout {

// Grouped by vendor; vendor order decides ties within one string
static const BrandToken NAMESPACE_TOKENS[] = {
    // urn:samsung.com:device:RemoteControlReceiver:1, "Samsung UPnP SDK/1.0"
    {"samsung.com",      TvBrand::SAMSUNG},
    {"samsung upnp sdk", TvBrand::SAMSUNG},
    // urn:lge-com:service:webos-second-screen:1, udap:rootservice
    {"lge-com",          TvBrand::LG},
    {"lge.com",          TvBrand::LG},
    {"udap",             TvBrand::LG},
    {"lgsmarttv",        TvBrand::LG},
    // urn:schemas-sony-com:service:IRCC:1
    {"schemas-sony-com", TvBrand::SONY},
    {"sony-com",         TvBrand::SONY},
    {"bravia",           TvBrand::SONY},
    {"jointspace",       TvBrand::PHILIPS},
    {"philips",          TvBrand::PHILIPS},
    // roku:ecp
    {"roku",             TvBrand::ROKU},
    // urn:dial-multiscreen-org:service:dial:1
    {"dial-multiscreen", TvBrand::GOOGLE},
    {"dial:1",           TvBrand::GOOGLE},
};

static const int NUM_NAMESPACE_TOKENS = sizeof(NAMESPACE_TOKENS) / sizeof(NAMESPACE_TOKENS[0]);

static const BrandToken MANUFACTURER_TOKENS[] = {
    {"samsung",        TvBrand::SAMSUNG},
    {"lg electronics", TvBrand::LG},
    {"sony",           TvBrand::SONY},
    {"philips",        TvBrand::PHILIPS},
    {"tp vision",      TvBrand::PHILIPS},
    {"hisense",        TvBrand::HISENSE},
    {"tcl",            TvBrand::TCL},
    {"panasonic",      TvBrand::PANASONIC},
    {"sharp",          TvBrand::SHARP},
    {"toshiba",        TvBrand::TOSHIBA},
    {"google",         TvBrand::GOOGLE},
    {"amazon",         TvBrand::AMAZON},
    {"fire",           TvBrand::AMAZON},
    {"apple",          TvBrand::APPLE},
    {"roku",           TvBrand::ROKU},
    {"torima",         TvBrand::TORIMA},
};

static const int NUM_MANUFACTURER_TOKENS = sizeof(MANUFACTURER_TOKENS) / sizeof(MANUFACTURER_TOKENS[0]);

// Display-name hints, broader than the manufacturer table
static const BrandToken NAME_TOKENS[] = {
    {"samsung",    TvBrand::SAMSUNG},
    {"tizen",      TvBrand::SAMSUNG},
    {"webos",      TvBrand::LG},
    {"[lg]",       TvBrand::LG},
    {"lg ",        TvBrand::LG},
    {"bravia",     TvBrand::SONY},
    {"sony",       TvBrand::SONY},
    {"philips",    TvBrand::PHILIPS},
    {"hisense",    TvBrand::HISENSE},
    {"tcl",        TvBrand::TCL},
    {"panasonic",  TvBrand::PANASONIC},
    {"sharp",      TvBrand::SHARP},
    {"toshiba",    TvBrand::TOSHIBA},
    {"chromecast", TvBrand::GOOGLE},
    {"fire tv",    TvBrand::AMAZON},
    {"firetv",     TvBrand::AMAZON},
    {"apple tv",   TvBrand::APPLE},
    {"roku",       TvBrand::ROKU},
    {"torima",     TvBrand::TORIMA},
};

static const int NUM_NAME_TOKENS = sizeof(NAME_TOKENS) / sizeof(NAME_TOKENS[0]);

static const char* const NAMESPACE_HEADERS[] = { "ST", "NT", "USN", "SERVER" };

static TvBrand matchTokens(const char* text, const BrandToken* tokens, int count) {
    if (text == nullptr || text[0] == '\0') return TvBrand::UNKNOWN;
    for (int i = 0; i < count; i++) {
        if (containsNoCase(text, tokens[i].token)) return tokens[i].brand;
    }
    return TvBrand::UNKNOWN;
}

TvBrand brandFromNamespace(const DiscoveredDevice& device) {
    TvBrand brand = matchTokens(device.serviceType, NAMESPACE_TOKENS, NUM_NAMESPACE_TOKENS);
    if (brand != TvBrand::UNKNOWN) return brand;

    for (const char* key : NAMESPACE_HEADERS) {
        brand = matchTokens(getHeader(device, key), NAMESPACE_TOKENS, NUM_NAMESPACE_TOKENS);
        if (brand != TvBrand::UNKNOWN) return brand;
    }
    return TvBrand::UNKNOWN;
}

TvBrand brandFromManufacturer(const char* manufacturer) {
    if (manufacturer == nullptr || manufacturer[0] == '\0') return TvBrand::UNKNOWN;

    // "lg" alone is too short for a substring match
    if (equalsNoCase(manufacturer, "lg")) return TvBrand::LG;

    return matchTokens(manufacturer, MANUFACTURER_TOKENS, NUM_MANUFACTURER_TOKENS);
}

TvBrand brandFromHardwareAddress(const char* ip, NeighborLookup lookup) {
    if (lookup == nullptr || ip == nullptr || ip[0] == '\0') return TvBrand::UNKNOWN;

    char mac[24];
    if (!lookup(ip, mac, sizeof(mac))) {
        LOG_TRACE("BRAND", "No neighbor entry for %s", ip);
        return TvBrand::UNKNOWN;
    }

    const char* vendor = lookupOuiVendor(mac);
    if (vendor == nullptr) {
        LOG_TRACE("BRAND", "Unlisted vendor prefix %s for %s", mac, ip);
        return TvBrand::UNKNOWN;
    }
    return brandFromManufacturer(vendor);
}

TvBrand brandFromHeuristics(const DiscoveredDevice& device) {
    if (containsNoCase(device.serviceType, "samsung")) return TvBrand::SAMSUNG;
    return matchTokens(device.displayName, NAME_TOKENS, NUM_NAME_TOKENS);
}

TvBrand detectBrand(const DiscoveredDevice& device, NeighborLookup lookup) {
    TvBrand brand = brandFromNamespace(device);
    if (brand != TvBrand::UNKNOWN) {
        LOG_DEBUG("BRAND", "%s: %s from namespace", device.address, tvBrandToString(brand));
        return brand;
    }

    brand = brandFromManufacturer(device.manufacturer);
    if (brand != TvBrand::UNKNOWN) {
        LOG_DEBUG("BRAND", "%s: %s from manufacturer", device.address, tvBrandToString(brand));
        return brand;
    }

    brand = brandFromHardwareAddress(device.address, lookup);
    if (brand != TvBrand::UNKNOWN) {
        LOG_DEBUG("BRAND", "%s: %s from hardware address", device.address, tvBrandToString(brand));
        return brand;
    }

    brand = brandFromHeuristics(device);
    LOG_DEBUG("BRAND", "%s: %s from heuristics", device.address, tvBrandToString(brand));
    return brand;
}

TvBrand detectBrand(const DiscoveredDevice& device) {
    return detectBrand(device, platformNeighborLookup());
}

DiscoveredDevice annotateBrand(const DiscoveredDevice& device, NeighborLookup lookup) {
    DiscoveredDevice annotated = device;
    if (annotated.brand != TvBrand::UNKNOWN) {
        annotated.brandDetected = true;
        return annotated;
    }

    annotated.brand = detectBrand(device, lookup);
    annotated.brandDetected = true;
    return annotated;
}

DiscoveredDevice annotateBrand(const DiscoveredDevice& device) {
    return annotateBrand(device, platformNeighborLookup());
}

} // namespace tvscout
