#pragma once
#include <cstddef>

namespace tvscout {

// Monotonic milliseconds since boot (millis() on the board)
unsigned long monotonicMs();

// IPv4 address of the interface discovery runs on.
// Returns false when no usable interface is up.
bool localIpv4(char* out, size_t outLen);

// SSID of the joined Wi-Fi network, empty when the platform cannot tell.
bool currentNetworkName(char* out, size_t outLen);

// Find the hardware address for ip in a /proc/net/arp style table.
// Incomplete entries (flags 0x0 or an all-zero MAC) are skipped.
bool parseArpTable(const char* table, const char* ip, char* mac, size_t macLen);

// Signature of a neighbor-cache lookup: ip -> "aa:bb:cc:dd:ee:ff"
typedef bool (*NeighborLookup)(const char* ip, char* mac, size_t macLen);

// Lookup backed by the OS neighbor cache, or nullptr where the platform
// does not expose one.
NeighborLookup platformNeighborLookup();

// Pause the host runner between polls (no-op budget on the board)
void idleMs(unsigned long ms);

} // namespace tvscout
