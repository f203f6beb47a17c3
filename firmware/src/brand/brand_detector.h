#pragma once
#include "../devices/discovered_device.h"
#include "../platform/platform.h"

namespace tvscout {

// Vendor-namespaced token seen in service types and SSDP headers
struct BrandToken {
    const char* token;  // lower-case substring
    TvBrand brand;
};

// Layer 1: vendor namespace tokens in serviceType and the ST, NT, USN and
// SERVER headers. Strings are scanned in that order and the first vendor
// matching a string wins.
TvBrand brandFromNamespace(const DiscoveredDevice& device);

// Layer 2: case-insensitive manufacturer spellings ("TP Vision" is Philips)
TvBrand brandFromManufacturer(const char* manufacturer);

// Layer 3: hardware address from the neighbor cache, vendor from the OUI
// table, then layer 2 on the vendor name. UNKNOWN when lookup is nullptr.
TvBrand brandFromHardwareAddress(const char* ip, NeighborLookup lookup);

// Layer 4: loose match on the display name and serviceType
TvBrand brandFromHeuristics(const DiscoveredDevice& device);

// First non-UNKNOWN layer wins. The single-argument form uses the
// platform neighbor cache when there is one.
TvBrand detectBrand(const DiscoveredDevice& device);
TvBrand detectBrand(const DiscoveredDevice& device, NeighborLookup lookup);

// Copy of device with brand set and brandDetected true. A brand other
// than UNKNOWN is kept as is.
DiscoveredDevice annotateBrand(const DiscoveredDevice& device);
DiscoveredDevice annotateBrand(const DiscoveredDevice& device, NeighborLookup lookup);

} // namespace tvscout
