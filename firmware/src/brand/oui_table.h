#pragma once
#include <cstddef>

namespace tvscout {

// Vendor prefix of a hardware address (first three octets, upper-case
// hex without separators, e.g. "F4F5D8")
struct OuiEntry {
    const char* prefix;
    const char* vendor;
};

// Vendor name for a hardware address in any common notation
// ("aa:bb:cc:dd:ee:ff", "AA-BB-CC-DD-EE-FF", "aabb.ccdd.eeff").
// Returns nullptr if the prefix is not a known TV/AV vendor.
const char* lookupOuiVendor(const char* mac);

// Normalize the first three octets into prefix (needs 7 bytes)
bool ouiPrefix(const char* mac, char* prefix, size_t prefixLen);

// Immutable table, for tests and diagnostics
const OuiEntry* getOuiEntries(int& count);

} // namespace tvscout
