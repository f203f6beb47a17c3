#include "dns_message.h"
#include "../util/text.h"
#include <cstdio>
#include <cstring>

namespace tvscout {

static const uint16_t DNS_CLASS_IN = 1;
static const uint16_t DNS_FLAG_RESPONSE = 0x8000;
static const int MAX_POINTER_JUMPS = 16;

static uint16_t read16(const uint8_t* p) {
    return (uint16_t)((p[0] << 8) | p[1]);
}

static uint32_t read32(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
           ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

static void write16(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)(v >> 8);
    p[1] = (uint8_t)(v & 0xFF);
}

int buildDnsQuery(uint16_t id, const char* name, DnsType type,
                  uint8_t* output, size_t outputLen) {
    if (name == nullptr || outputLen < 12) return -1;

    memset(output, 0, 12);
    write16(output, id);
    write16(output + 4, 1);  // QDCOUNT
    size_t pos = 12;

    const char* label = name;
    while (*label) {
        const char* dot = strchr(label, '.');
        size_t len = dot ? (size_t)(dot - label) : strlen(label);
        if (len == 0 || len > 63) return -1;
        if (pos + 1 + len >= outputLen) return -1;
        output[pos++] = (uint8_t)len;
        memcpy(output + pos, label, len);
        pos += len;
        label += len;
        if (*label == '.') label++;
    }

    if (pos + 5 > outputLen) return -1;
    output[pos++] = 0;
    write16(output + pos, (uint16_t)type);
    pos += 2;
    write16(output + pos, DNS_CLASS_IN);
    pos += 2;
    return (int)pos;
}

int readDnsName(const uint8_t* msg, size_t msgLen, size_t offset,
                char* output, size_t outputLen) {
    if (outputLen == 0) return -1;
    output[0] = '\0';

    size_t out = 0;
    size_t pos = offset;
    int resume = -1;
    int jumps = 0;

    while (true) {
        if (pos >= msgLen) return -1;
        uint8_t len = msg[pos];

        if (len == 0) {
            pos++;
            break;
        }

        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= msgLen) return -1;
            if (++jumps > MAX_POINTER_JUMPS) return -1;
            if (resume < 0) resume = (int)(pos + 2);
            pos = ((len & 0x3F) << 8) | msg[pos + 1];
            continue;
        }

        if ((len & 0xC0) != 0) return -1;
        if (pos + 1 + len > msgLen) return -1;

        if (out > 0 && out + 1 < outputLen) output[out++] = '.';
        for (uint8_t i = 0; i < len && out + 1 < outputLen; i++) {
            output[out++] = (char)msg[pos + 1 + i];
        }
        output[out] = '\0';
        pos += 1 + len;
    }

    return resume >= 0 ? resume : (int)pos;
}

int parseDnsMessage(const uint8_t* msg, size_t msgLen,
                    DnsRecordVisitor visitor, void* context) {
    if (msg == nullptr || msgLen < 12) return -1;

    uint16_t flags = read16(msg + 2);
    if ((flags & DNS_FLAG_RESPONSE) == 0) return -1;

    uint16_t qdCount = read16(msg + 4);
    int rrCount = read16(msg + 6) + read16(msg + 8) + read16(msg + 10);

    size_t pos = 12;
    char scratch[DNS_NAME_LEN];

    // Skip questions
    for (uint16_t i = 0; i < qdCount; i++) {
        int next = readDnsName(msg, msgLen, pos, scratch, sizeof(scratch));
        if (next < 0 || (size_t)next + 4 > msgLen) return 0;
        pos = (size_t)next + 4;
    }

    int visited = 0;
    for (int i = 0; i < rrCount; i++) {
        DnsRecord record;
        memset(&record, 0, sizeof(record));

        int next = readDnsName(msg, msgLen, pos, record.name, sizeof(record.name));
        if (next < 0 || (size_t)next + 10 > msgLen) break;
        pos = (size_t)next;

        record.type = read16(msg + pos);
        record.ttl = read32(msg + pos + 4);
        record.rdataLength = read16(msg + pos + 8);
        pos += 10;
        if (pos + record.rdataLength > msgLen) break;
        record.rdata = msg + pos;

        bool valid = true;
        switch ((DnsType)record.type) {
            case DnsType::A:
                if (record.rdataLength == 4) {
                    snprintf(record.address, sizeof(record.address), "%u.%u.%u.%u",
                             msg[pos], msg[pos + 1], msg[pos + 2], msg[pos + 3]);
                } else {
                    valid = false;
                }
                break;
            case DnsType::PTR:
                valid = readDnsName(msg, msgLen, pos, record.target, sizeof(record.target)) >= 0;
                break;
            case DnsType::SRV:
                // priority(2) weight(2) port(2) target
                if (record.rdataLength >= 7) {
                    record.port = read16(msg + pos + 4);
                    valid = readDnsName(msg, msgLen, pos + 6, record.target,
                                        sizeof(record.target)) >= 0;
                } else {
                    valid = false;
                }
                break;
            default:
                break;
        }

        pos += record.rdataLength;
        if (!valid) continue;

        if (visitor != nullptr) visitor(record, context);
        visited++;
    }

    return visited;
}

size_t txtRdataToLines(const uint8_t* rdata, size_t rdataLen, char* output, size_t outputLen) {
    if (output == nullptr || outputLen == 0) return 0;
    output[0] = '\0';
    if (rdata == nullptr) return 0;

    size_t out = 0;
    size_t pos = 0;
    while (pos < rdataLen) {
        uint8_t len = rdata[pos++];
        if (pos + len > rdataLen) len = (uint8_t)(rdataLen - pos);
        if (len == 0) continue;

        if (out > 0 && out + 1 < outputLen) output[out++] = '\n';
        for (uint8_t i = 0; i < len && out + 1 < outputLen; i++) {
            char c = (char)rdata[pos + i];
            // a stray newline inside a string would split a pair
            output[out++] = (c == '\n') ? ' ' : c;
        }
        pos += len;
    }
    output[out] = '\0';
    return out;
}

int parseTxtLines(const char* text, TxtPair* pairs, int maxPairs) {
    if (text == nullptr || pairs == nullptr) return 0;

    int count = 0;
    const char* line = text;
    while (*line) {
        const char* end = strchr(line, '\n');
        size_t lineLen = end ? (size_t)(end - line) : strlen(line);
        const char* eq = (const char*)memchr(line, '=', lineLen);

        if (eq != nullptr && eq > line) {
            char key[sizeof(pairs[0].key)];
            size_t rawKeyLen = (size_t)(eq - line);
            size_t keyLen = rawKeyLen;
            if (keyLen >= sizeof(key)) keyLen = sizeof(key) - 1;
            memcpy(key, line, keyLen);
            key[keyLen] = '\0';
            toLowerInPlace(key);

            TxtPair* slot = nullptr;
            for (int i = 0; i < count; i++) {
                if (strcmp(pairs[i].key, key) == 0) {
                    slot = &pairs[i];
                    break;
                }
            }
            if (slot == nullptr && count < maxPairs) slot = &pairs[count++];

            if (slot != nullptr) {
                copyString(slot->key, sizeof(slot->key), key);
                size_t valueLen = lineLen - rawKeyLen - 1;
                if (valueLen >= sizeof(slot->value)) valueLen = sizeof(slot->value) - 1;
                memcpy(slot->value, eq + 1, valueLen);
                slot->value[valueLen] = '\0';
            }
        }

        if (end == nullptr) break;
        line = end + 1;
    }
    return count;
}

const char* findTxtValue(const TxtPair* pairs, int count, const char* key) {
    for (int i = 0; i < count; i++) {
        if (strcmp(pairs[i].key, key) == 0) return pairs[i].value;
    }
    return nullptr;
}

} // namespace tvscout
