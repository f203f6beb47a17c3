#include "xml_fields.h"
#include "../util/text.h"
#include <cstring>

namespace tvscout {

struct XmlEntity {
    const char* encoded;
    char decoded;
};

// &amp; last so "&amp;lt;" decodes to "&lt;"
static const XmlEntity ENTITIES[] = {
    {"&lt;",   '<'},
    {"&gt;",   '>'},
    {"&apos;", '\''},
    {"&quot;", '"'},
    {"&amp;",  '&'}
};
static const int NUM_ENTITIES = sizeof(ENTITIES) / sizeof(ENTITIES[0]);

static void replaceAll(char* s, const char* encoded, char decoded) {
    size_t encLen = strlen(encoded);
    char* hit = strstr(s, encoded);
    while (hit != nullptr) {
        *hit = decoded;
        memmove(hit + 1, hit + encLen, strlen(hit + encLen) + 1);
        hit = strstr(hit + 1, encoded);
    }
}

void replaceXmlEntities(char* s) {
    if (s == nullptr) return;
    for (int i = 0; i < NUM_ENTITIES; i++) {
        replaceAll(s, ENTITIES[i].encoded, ENTITIES[i].decoded);
    }
}

// Find "<tag" or "<prefix:tag" followed by '>', ' ' or '/'.
// Returns pointer past the closing '>' of the start tag.
static const char* findStartTag(const char* xml, const char* tag, size_t tagLen) {
    const char* p = strchr(xml, '<');
    while (p != nullptr) {
        const char* name = p + 1;
        if (*name != '/' && *name != '?' && *name != '!') {
            size_t nameLen = strcspn(name, " \t\r\n/>");
            const char* local = name;
            const char* colon = (const char*)memchr(name, ':', nameLen);
            if (colon != nullptr) local = colon + 1;
            size_t localLen = nameLen - (size_t)(local - name);

            if (localLen == tagLen && strncmp(local, tag, tagLen) == 0) {
                const char* close = strchr(name + nameLen, '>');
                if (close == nullptr) return nullptr;
                if (close > name && close[-1] == '/') return nullptr;  // <tag/>
                return close + 1;
            }
        }
        p = strchr(p + 1, '<');
    }
    return nullptr;
}

bool extractXmlElement(const char* xml, const char* tag, char* output, size_t outputLen) {
    if (xml == nullptr || tag == nullptr || output == nullptr || outputLen == 0) return false;
    output[0] = '\0';

    size_t tagLen = strlen(tag);
    const char* start = findStartTag(xml, tag, tagLen);
    if (start == nullptr) return false;

    // Text ends at the next tag, which is the end tag for leaf elements
    const char* end = strchr(start, '<');
    if (end == nullptr) return false;

    copyTrimmed(output, outputLen, start, (size_t)(end - start));
    replaceXmlEntities(output);
    return output[0] != '\0';
}

bool parseDeviceDescription(const char* xml, DeviceDescription& info) {
    memset(&info, 0, sizeof(info));
    if (xml == nullptr) return false;

    bool any = false;
    any |= extractXmlElement(xml, "friendlyName", info.friendlyName, sizeof(info.friendlyName));
    any |= extractXmlElement(xml, "manufacturer", info.manufacturer, sizeof(info.manufacturer));
    any |= extractXmlElement(xml, "modelName", info.modelName, sizeof(info.modelName));
    any |= extractXmlElement(xml, "deviceType", info.deviceType, sizeof(info.deviceType));
    return any;
}

void shortServiceType(const char* raw, char* output, size_t outputLen) {
    if (output == nullptr || outputLen == 0) return;
    output[0] = '\0';
    if (raw == nullptr) return;

    if (!startsWith(raw, "urn:")) {
        copyString(output, outputLen, raw);
        return;
    }

    // Second-to-last ':' segment
    const char* last = strrchr(raw, ':');
    const char* start = last;
    while (start > raw && start[-1] != ':') start--;
    copyTrimmed(output, outputLen, start, (size_t)(last - start));
}

} // namespace tvscout
