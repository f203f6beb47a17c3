#include "ssdp_discovery.h"
#include "../debug_log.h"
#include "../protocols/xml_fields.h"
#include "../util/text.h"
#include <cstring>

namespace tvscout {

// Response headers kept on the record for brand detection
static const char* KEPT_HEADERS[] = {"ST", "NT", "USN", "SERVER"};
static const int NUM_KEPT_HEADERS = 4;

SsdpDiscovery::SsdpDiscovery(Transport& transport)
    : _transport(transport), _socket(INVALID_HANDLE), _lastSearchMs(0),
      _processedCount(0) {
    for (int i = 0; i < SSDP_FETCH_SLOTS; i++) {
        _slots[i].fetch.setTransport(transport);
        _slots[i].busy = false;
        _slots[i].ip[0] = '\0';
        _slots[i].headerCount = 0;
    }
}

SsdpDiscovery::~SsdpDiscovery() {
    cleanup();
}

bool SsdpDiscovery::onStart(const DiscoveryOptions& options, unsigned long nowMs) {
    (void)options;
    _processedCount = 0;

    _socket = _transport.udpOpen(0);
    if (_socket == INVALID_HANDLE) {
        emitError(DiscoveryError::TRANSPORT, "SSDP socket could not be opened");
        return false;
    }

    LOG_INFO("SSDP", "Searching (%d targets)", NUM_SSDP_SEARCH_TARGETS);
    sendSearches();
    _lastSearchMs = nowMs;
    return true;
}

void SsdpDiscovery::sendSearches() {
    char msg[256];
    for (int i = 0; i < NUM_SSDP_SEARCH_TARGETS; i++) {
        int len = buildMSearch(SSDP_SEARCH_TARGETS[i], msg, sizeof(msg));
        if (len < 0) continue;
        // A failed target is not fatal; the others may still get answers
        if (!_transport.udpSendTo(_socket, SSDP_MULTICAST_ADDRESS, SSDP_PORT,
                                  (const uint8_t*)msg, (size_t)len)) {
            LOG_DEBUG("SSDP", "M-SEARCH for %s not sent", SSDP_SEARCH_TARGETS[i]);
        }
    }
}

void SsdpDiscovery::onPoll(unsigned long nowMs) {
    if (nowMs - _lastSearchMs >= SSDP_SEARCH_INTERVAL_MS) {
        sendSearches();
        _lastSearchMs = nowMs;
    }

    receiveResponses(nowMs);
    if (!isActive()) return;
    pollFetches(nowMs);
}

void SsdpDiscovery::receiveResponses(unsigned long nowMs) {
    char fromIp[ADDRESS_LEN];

    while (isActive()) {
        int n = _transport.udpReceive(_socket, (uint8_t*)_packet, sizeof(_packet) - 1,
                                      fromIp, sizeof(fromIp));
        if (n == 0) break;
        if (n < 0) {
            emitError(DiscoveryError::TRANSPORT, "SSDP receive failed");
            break;
        }
        _packet[n] = '\0';
        handleResponse(fromIp, _packet, (size_t)n, nowMs);
    }
}

void SsdpDiscovery::handleResponse(const char* ip, const char* raw, size_t len,
                                   unsigned long nowMs) {
    if (alreadyProcessed(ip)) return;

    SsdpHeaders headers;
    if (!parseSsdpHeaders(raw, len, headers)) return;

    const char* location = findSsdpHeader(headers, "LOCATION");
    if (location == nullptr || location[0] == '\0') return;

    // Leave it unclaimed so a later response can still win a slot
    FetchSlot* slot = freeSlot();
    if (slot == nullptr) {
        LOG_TRACE("SSDP", "All fetch slots busy, deferring %s", ip);
        return;
    }

    if (_processedCount >= MAX_TRACKED_DEVICES) {
        LOG_DEBUG("SSDP", "Responder table full, ignoring %s", ip);
        return;
    }
    copyString(_processed[_processedCount++], ADDRESS_LEN, ip);

    if (!slot->fetch.begin(location, SSDP_HTTP_TIMEOUT_MS, nowMs)) {
        emitError(DiscoveryError::PROTOCOL, "Description fetch for %s failed to start", ip);
        return;
    }

    slot->busy = true;
    copyString(slot->ip, sizeof(slot->ip), ip);
    slot->headerCount = 0;
    for (int i = 0; i < NUM_KEPT_HEADERS; i++) {
        const char* value = findSsdpHeader(headers, KEPT_HEADERS[i]);
        if (value == nullptr) continue;
        ProtocolHeader& h = slot->headers[slot->headerCount++];
        copyString(h.key, sizeof(h.key), KEPT_HEADERS[i]);
        copyString(h.value, sizeof(h.value), value);
    }

    LOG_DEBUG("SSDP", "%s -> %s", ip, location);
}

void SsdpDiscovery::pollFetches(unsigned long nowMs) {
    for (int i = 0; i < SSDP_FETCH_SLOTS && isActive(); i++) {
        FetchSlot& slot = _slots[i];
        if (!slot.busy) continue;

        FetchResult r = slot.fetch.poll(nowMs);
        if (r == FetchResult::PENDING) continue;

        slot.busy = false;
        if (r == FetchResult::DONE && !finishFetch(slot)) {
            LOG_DEBUG("SSDP", "Unusable description from %s", slot.ip);
        }
    }
}

bool SsdpDiscovery::finishFetch(FetchSlot& slot) {
    if (slot.fetch.status() != 200) return false;

    DeviceDescription info;
    if (!parseDeviceDescription(slot.fetch.body(), info)) return false;

    DiscoveredDevice device;
    initDevice(device);
    setField(device.address, sizeof(device.address), slot.ip);
    setField(device.displayName, sizeof(device.displayName),
             info.friendlyName[0] ? info.friendlyName : "Smart Device");
    device.method = DiscoveryMethod::SSDP;
    setField(device.location, sizeof(device.location), slot.fetch.url());
    setField(device.manufacturer, sizeof(device.manufacturer), info.manufacturer);
    setField(device.modelName, sizeof(device.modelName), info.modelName);
    shortServiceType(info.deviceType, device.serviceType, sizeof(device.serviceType));

    UrlParts parts;
    if (parseUrl(slot.fetch.url(), parts)) device.port = parts.port;

    for (int i = 0; i < slot.headerCount; i++) {
        setHeader(device, slot.headers[i].key, slot.headers[i].value);
    }

    emit(device);
    return true;
}

bool SsdpDiscovery::alreadyProcessed(const char* ip) const {
    for (int i = 0; i < _processedCount; i++) {
        if (strcmp(_processed[i], ip) == 0) return true;
    }
    return false;
}

SsdpDiscovery::FetchSlot* SsdpDiscovery::freeSlot() {
    for (int i = 0; i < SSDP_FETCH_SLOTS; i++) {
        if (!_slots[i].busy) return &_slots[i];
    }
    return nullptr;
}

void SsdpDiscovery::cleanup() {
    for (int i = 0; i < SSDP_FETCH_SLOTS; i++) {
        _slots[i].fetch.cancel();
        _slots[i].busy = false;
    }
    if (_socket != INVALID_HANDLE) {
        _transport.close(_socket);
        _socket = INVALID_HANDLE;
    }
}

} // namespace tvscout
