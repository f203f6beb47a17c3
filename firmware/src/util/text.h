#pragma once
#include <cstddef>

namespace tvscout {

// Bounded string helpers shared by the parsers, all null-safe

// Copy src into dest (always terminated). Returns false if src was truncated.
bool copyString(char* dest, size_t destLen, const char* src);

// Copy srcLen bytes of src with leading/trailing whitespace removed.
// Returns the resulting length.
size_t copyTrimmed(char* dest, size_t destLen, const char* src, size_t srcLen);

// ASCII case-insensitive comparisons
bool equalsNoCase(const char* a, const char* b);
bool containsNoCase(const char* haystack, const char* needle);
bool startsWith(const char* s, const char* prefix);

void toLowerInPlace(char* s);
void toUpperInPlace(char* s);

// Strict dotted-quad IPv4 check ("192.168.1.20")
bool isValidIpv4(const char* s);

} // namespace tvscout
