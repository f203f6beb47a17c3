#pragma once
#include <ArduinoJson.h>
#include "discovered_device.h"

namespace tvscout {

// Write a device record into doc as a flat object.
// Absent optional fields are written as null.
bool deviceToJson(JsonDocument& doc, const DiscoveredDevice& device);

// Read a device record written by deviceToJson.
// Returns false if "ip" or "friendlyName" is missing.
bool deviceFromJson(JsonObjectConst obj, DiscoveredDevice& device);

} // namespace tvscout
