#include "reconcile.h"
#include "../debug_log.h"
#include <cstring>

namespace tvscout {

const char* mergeActionToString(MergeAction action) {
    switch (action) {
        case MergeAction::ACCEPT_NEW:          return "accept_new";
        case MergeAction::UPGRADE_NAME:        return "upgrade_name";
        case MergeAction::UPGRADE_AUTHORITY:   return "upgrade_authority";
        case MergeAction::RESOLVE_PLACEHOLDER: return "resolve_placeholder";
        case MergeAction::ENRICH:              return "enrich";
        case MergeAction::IGNORE:              return "ignore";
        case MergeAction::REJECT_FULL:         return "reject_full";
        default:                               return "unknown";
    }
}

bool isEmission(MergeAction action) {
    return action != MergeAction::IGNORE && action != MergeAction::REJECT_FULL;
}

DeviceCache::DeviceCache() : _count(0) {}

void DeviceCache::clear() {
    _count = 0;
}

int DeviceCache::indexOf(const char* address) const {
    for (int i = 0; i < _count; i++) {
        if (strcmp(_devices[i].address, address) == 0) return i;
    }
    return -1;
}

const DiscoveredDevice* DeviceCache::find(const char* address) const {
    int index = indexOf(address);
    return index >= 0 ? &_devices[index] : nullptr;
}

MergeAction DeviceCache::reconcile(const DiscoveredDevice& incoming, DiscoveredDevice& merged) {
    int index = indexOf(incoming.address);

    // 1. New address
    if (index < 0) {
        if (_count >= MAX_TRACKED_DEVICES) {
            LOG_ERROR("MERGE", "Device table full, dropping %s", incoming.address);
            return MergeAction::REJECT_FULL;
        }
        _devices[_count++] = incoming;
        merged = incoming;
        return MergeAction::ACCEPT_NEW;
    }

    DiscoveredDevice& existing = _devices[index];
    bool existingPlaceholder = isPlaceholderName(existing.displayName);
    bool incomingPlaceholder = isPlaceholderName(incoming.displayName);

    // 2. Authority record: only its placeholder name may change
    if (isAuthoritySource(existing.method)) {
        if (existingPlaceholder && !incomingPlaceholder) {
            setField(existing.displayName, sizeof(existing.displayName), incoming.displayName);
            merged = existing;
            return MergeAction::UPGRADE_NAME;
        }
        return MergeAction::IGNORE;
    }

    // 3. Authority record replaces anything weaker
    if (isAuthoritySource(incoming.method)) {
        unsigned long firstSeen = existing.firstSeenMs;
        existing = incoming;
        existing.firstSeenMs = firstSeen;
        merged = existing;
        return MergeAction::UPGRADE_AUTHORITY;
    }

    // 4. Placeholder resolved by any source
    if (existingPlaceholder && !incomingPlaceholder) {
        unsigned long firstSeen = existing.firstSeenMs;
        existing = incoming;
        existing.firstSeenMs = firstSeen;
        merged = existing;
        return MergeAction::RESOLVE_PLACEHOLDER;
    }

    // 5. Fill in the vendor without touching anything else.
    // The address is trusted to still be the same device; a lease that
    // moved to another device mid-session would mix the two here.
    if (existing.manufacturer[0] == '\0' && incoming.manufacturer[0] != '\0') {
        setField(existing.manufacturer, sizeof(existing.manufacturer), incoming.manufacturer);
        if (incoming.modelName[0] != '\0') {
            setField(existing.modelName, sizeof(existing.modelName), incoming.modelName);
        }
        if (incoming.serviceType[0] != '\0') {
            setField(existing.serviceType, sizeof(existing.serviceType), incoming.serviceType);
        }
        merged = existing;
        return MergeAction::ENRICH;
    }

    // 6. Nothing new
    return MergeAction::IGNORE;
}

} // namespace tvscout
