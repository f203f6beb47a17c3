#pragma once
#include <cstddef>
#include "../devices/discovered_device.h"

namespace tvscout {

#define SSDP_MULTICAST_ADDRESS "239.255.255.250"
static const uint16_t SSDP_PORT = 1900;

static const int SSDP_MAX_HEADERS = 10;

// Broad targets first, then device classes that ignore ssdp:all
extern const char* const SSDP_SEARCH_TARGETS[];
extern const int NUM_SSDP_SEARCH_TARGETS;

struct SsdpHeaders {
    ProtocolHeader entries[SSDP_MAX_HEADERS];
    int count;
};

// Format an M-SEARCH request for the given search target.
// Returns length written, or -1 if the buffer is too small.
int buildMSearch(const char* searchTarget, char* output, size_t outputLen);

// Parse the header lines of an SSDP response or NOTIFY. Names are
// upper-cased, values trimmed; lines without ':' (the status line) are
// skipped. Returns false when no header was found.
bool parseSsdpHeaders(const char* raw, size_t rawLen, SsdpHeaders& headers);

// Value for key (case-insensitive), or nullptr
const char* findSsdpHeader(const SsdpHeaders& headers, const char* key);

} // namespace tvscout
