#include "ssdp.h"
#include "../config.h"
#include "../util/text.h"
#include <cstdio>
#include <cstring>

namespace tvscout {

const char* const SSDP_SEARCH_TARGETS[] = {
    "ssdp:all",
    "upnp:rootdevice",
    "urn:schemas-upnp-org:device:MediaRenderer:1",
    "urn:dial-multiscreen-org:service:dial:1"
};
const int NUM_SSDP_SEARCH_TARGETS = sizeof(SSDP_SEARCH_TARGETS) / sizeof(SSDP_SEARCH_TARGETS[0]);

int buildMSearch(const char* searchTarget, char* output, size_t outputLen) {
    if (searchTarget == nullptr) return -1;

    int n = snprintf(output, outputLen,
                     "M-SEARCH * HTTP/1.1\r\n"
                     "HOST: %s:%u\r\n"
                     "MAN: \"ssdp:discover\"\r\n"
                     "MX: 3\r\n"
                     "ST: %s\r\n"
                     "USER-AGENT: %s\r\n"
                     "\r\n",
                     SSDP_MULTICAST_ADDRESS, SSDP_PORT, searchTarget, USER_AGENT);
    if (n < 0 || (size_t)n >= outputLen) return -1;
    return n;
}

bool parseSsdpHeaders(const char* raw, size_t rawLen, SsdpHeaders& headers) {
    headers.count = 0;
    if (raw == nullptr) return false;

    size_t pos = 0;
    while (pos < rawLen) {
        size_t lineEnd = pos;
        while (lineEnd < rawLen && raw[lineEnd] != '\n') lineEnd++;

        size_t lineLen = lineEnd - pos;
        const char* line = raw + pos;
        const char* colon = (const char*)memchr(line, ':', lineLen);

        if (colon != nullptr && colon > line && headers.count < SSDP_MAX_HEADERS) {
            ProtocolHeader& h = headers.entries[headers.count];
            size_t keyLen = copyTrimmed(h.key, sizeof(h.key), line, (size_t)(colon - line));
            // "HTTP/1.1 200 OK" has no colon; a key with spaces is not a header
            if (keyLen > 0 && strchr(h.key, ' ') == nullptr) {
                toUpperInPlace(h.key);
                size_t valueLen = lineLen - (size_t)(colon + 1 - line);
                copyTrimmed(h.value, sizeof(h.value), colon + 1, valueLen);
                headers.count++;
            }
        }

        pos = lineEnd + 1;
    }

    return headers.count > 0;
}

const char* findSsdpHeader(const SsdpHeaders& headers, const char* key) {
    for (int i = 0; i < headers.count; i++) {
        if (equalsNoCase(headers.entries[i].key, key)) {
            return headers.entries[i].value;
        }
    }
    return nullptr;
}

} // namespace tvscout
