#pragma once
#include <cstddef>

namespace tvscout {

// Minimal extraction from UPnP description documents. These are small,
// flat and machine-written, so a tag scan is enough.

// Replace &lt; &gt; &apos; &quot; &amp; in place
void replaceXmlEntities(char* s);

// Text of the first <tag>...</tag> (any namespace prefix, attributes
// allowed), entities replaced and whitespace trimmed.
// Returns false when the element is missing or empty.
bool extractXmlElement(const char* xml, const char* tag, char* output, size_t outputLen);

struct DeviceDescription {
    char friendlyName[64];
    char manufacturer[48];
    char modelName[48];
    char deviceType[96];
};

// Fill the fields present in a device description; missing ones stay empty.
// Returns true when at least one field was found.
bool parseDeviceDescription(const char* xml, DeviceDescription& info);

// "urn:schemas-upnp-org:device:MediaRenderer:1" -> "MediaRenderer".
// Values that are not URNs are copied unchanged.
void shortServiceType(const char* raw, char* output, size_t outputLen);

} // namespace tvscout
