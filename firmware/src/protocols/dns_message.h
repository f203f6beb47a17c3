#pragma once
#include <cstddef>
#include <cstdint>

namespace tvscout {

// DNS wire format, as far as service browsing needs it
// (RFC 1035 framing, RFC 6763 record usage).

enum class DnsType : uint16_t {
    A   = 1,
    PTR = 12,
    TXT = 16,
    SRV = 33
};

static const size_t DNS_NAME_LEN = 128;

struct DnsRecord {
    char name[DNS_NAME_LEN];
    uint16_t type;
    uint32_t ttl;
    char target[DNS_NAME_LEN];  // PTR domain name or SRV target host
    uint16_t port;              // SRV
    char address[16];           // A, dotted quad
    const uint8_t* rdata;       // points into the message
    uint16_t rdataLength;
};

typedef void (*DnsRecordVisitor)(const DnsRecord& record, void* context);

// Single-question query, class IN. Returns length, or -1 on overflow
// or a label longer than 63 bytes.
int buildDnsQuery(uint16_t id, const char* name, DnsType type,
                  uint8_t* output, size_t outputLen);

// Read a possibly compressed name starting at offset. Returns the offset
// just past the name in the original position, or -1 if malformed.
int readDnsName(const uint8_t* msg, size_t msgLen, size_t offset,
                char* output, size_t outputLen);

// Visit every resource record in the answer, authority and additional
// sections. Returns the number visited, or -1 when the message is not a
// response or the header is truncated. A malformed record stops the walk
// but records before it are still delivered.
int parseDnsMessage(const uint8_t* msg, size_t msgLen,
                    DnsRecordVisitor visitor, void* context);

// TXT rdata (length-prefixed strings) to '\n'-separated lines
size_t txtRdataToLines(const uint8_t* rdata, size_t rdataLen, char* output, size_t outputLen);

struct TxtPair {
    char key[16];
    char value[64];
};

// Parse "key=value" lines. Keys are lower-cased; lines without '=' or
// with an empty key are skipped. Later duplicates overwrite earlier ones.
// Returns number of pairs stored.
int parseTxtLines(const char* text, TxtPair* pairs, int maxPairs);

const char* findTxtValue(const TxtPair* pairs, int count, const char* key);

} // namespace tvscout
