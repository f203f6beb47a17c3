#pragma once
#include "../config.h"
#include "../devices/discovered_device.h"

namespace tvscout {

// Outcome of merging one incoming record, in rule order
enum class MergeAction : uint8_t {
    ACCEPT_NEW          = 0,  // unknown address
    UPGRADE_NAME        = 1,  // authority record gets a real name for its placeholder
    UPGRADE_AUTHORITY   = 2,  // authority record replaces a weaker one
    RESOLVE_PLACEHOLDER = 3,  // real name replaces a placeholder
    ENRICH              = 4,  // manufacturer/model/service type filled in
    IGNORE              = 5,  // nothing new
    REJECT_FULL         = 6   // new address but no room left
};

const char* mergeActionToString(MergeAction action);

// True when the action produced a record that must be published
bool isEmission(MergeAction action);

// Address -> last published record for one discovery session.
// Only the orchestrator writes to it.
class DeviceCache {
public:
    DeviceCache();

    void clear();

    // Apply the merge rules to incoming. When the result is an emission,
    // merged receives the record to publish and the cache stores it.
    MergeAction reconcile(const DiscoveredDevice& incoming, DiscoveredDevice& merged);

    const DiscoveredDevice* find(const char* address) const;

    int count() const { return _count; }
    const DiscoveredDevice& at(int index) const { return _devices[index]; }

private:
    int indexOf(const char* address) const;

    DiscoveredDevice _devices[MAX_TRACKED_DEVICES];
    int _count;
};

} // namespace tvscout
