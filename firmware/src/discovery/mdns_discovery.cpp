#include "mdns_discovery.h"
#include "../debug_log.h"
#include "../util/text.h"
#include <cstring>

namespace tvscout {

const char* const MDNS_SERVICE_TYPES[] = {
    "_googlecast._tcp.local",       // Chromecast, Android TV, Google TV
    "_airplay._tcp.local",          // Apple TV, AirPlay receivers
    "_spotify-connect._tcp.local",
    "_dlna-wss._tcp.local"
};
const int NUM_MDNS_SERVICE_TYPES = sizeof(MDNS_SERVICE_TYPES) / sizeof(MDNS_SERVICE_TYPES[0]);

void mdnsServiceLabel(const char* serviceType, char* output, size_t outputLen) {
    if (output == nullptr || outputLen == 0) return;
    output[0] = '\0';
    if (serviceType == nullptr) return;

    size_t out = 0;
    for (const char* p = serviceType; *p && *p != '.' && out + 1 < outputLen; p++) {
        if (*p == '_') continue;
        output[out++] = *p;
    }
    output[out] = '\0';
    if (output[0] >= 'a' && output[0] <= 'z') output[0] -= 32;
}

const char* inferManufacturer(const char* serviceType) {
    if (containsNoCase(serviceType, "googlecast")) return "Google";
    if (containsNoCase(serviceType, "airplay")) return "Apple";
    if (containsNoCase(serviceType, "spotify")) return "Spotify";
    if (containsNoCase(serviceType, "dlna")) return "DLNA";
    return "Unknown";
}

MdnsDiscovery::MdnsDiscovery(Transport& transport)
    : _transport(transport), _socket(INVALID_HANDLE), _queryId(0), _service(0),
      _serviceStartMs(0), _lastFollowUpMs(0), _instanceCount(0), _hostCount(0) {}

MdnsDiscovery::~MdnsDiscovery() {
    cleanup();
}

bool MdnsDiscovery::onStart(const DiscoveryOptions& options, unsigned long nowMs) {
    (void)options;
    _instanceCount = 0;
    _hostCount = 0;
    _service = 0;

    _socket = _transport.udpOpen(0);
    if (_socket == INVALID_HANDLE) {
        emitError(DiscoveryError::TRANSPORT, "mDNS socket could not be opened");
        return false;
    }

    beginService(nowMs);
    return true;
}

void MdnsDiscovery::beginService(unsigned long nowMs) {
    _serviceStartMs = nowMs;
    _lastFollowUpMs = nowMs;
    if (_service >= NUM_MDNS_SERVICE_TYPES) return;

    LOG_DEBUG("MDNS", "Browsing %s", MDNS_SERVICE_TYPES[_service]);
    sendQuery(MDNS_SERVICE_TYPES[_service], DnsType::PTR);
}

void MdnsDiscovery::sendQuery(const char* name, DnsType type) {
    uint8_t query[300];
    int len = buildDnsQuery(++_queryId, name, type, query, sizeof(query));
    if (len < 0) {
        LOG_DEBUG("MDNS", "Query for %s too long", name);
        return;
    }
    if (!_transport.udpSendTo(_socket, MDNS_ADDRESS, MDNS_PORT, query, (size_t)len)) {
        LOG_DEBUG("MDNS", "Query for %s not sent", name);
    }
}

void MdnsDiscovery::sendFollowUps() {
    for (int i = 0; i < _instanceCount; i++) {
        Instance& inst = _instances[i];
        if (inst.emitted || (inst.haveSrv && inst.haveTxt)) continue;
        if (inst.followUps >= MDNS_MAX_FOLLOW_UPS) continue;
        inst.followUps++;
        if (!inst.haveSrv) sendQuery(inst.name, DnsType::SRV);
        if (!inst.haveTxt) sendQuery(inst.name, DnsType::TXT);
    }
    for (int i = 0; i < _hostCount; i++) {
        Host& host = _hosts[i];
        if (host.address[0] != '\0' || host.followUps >= MDNS_MAX_FOLLOW_UPS) continue;
        host.followUps++;
        sendQuery(host.name, DnsType::A);
    }
}

void MdnsDiscovery::onPoll(unsigned long nowMs) {
    receive();
    if (!isActive()) return;

    if (_service < NUM_MDNS_SERVICE_TYPES && nowMs - _serviceStartMs >= MDNS_SERVICE_WINDOW_MS) {
        // Window over: emit what resolved even without TXT
        emitReady(true);
        if (!isActive()) return;
        _service++;
        beginService(nowMs);
        return;
    }

    // After the last window the session idles until its timeout so that
    // slow responders still get through
    emitReady(_service >= NUM_MDNS_SERVICE_TYPES);
    if (!isActive()) return;

    if (nowMs - _lastFollowUpMs >= MDNS_FOLLOWUP_MS) {
        sendFollowUps();
        _lastFollowUpMs = nowMs;
    }
}

void MdnsDiscovery::receive() {
    while (isActive()) {
        int n = _transport.udpReceive(_socket, _packet, sizeof(_packet), nullptr, 0);
        if (n == 0) break;
        if (n < 0) {
            emitError(DiscoveryError::TRANSPORT, "mDNS receive failed");
            break;
        }
        if (parseDnsMessage(_packet, (size_t)n, visitRecord, this) < 0) {
            LOG_TRACE("MDNS", "Ignoring non-response packet (%d bytes)", n);
        }
    }
}

void MdnsDiscovery::visitRecord(const DnsRecord& record, void* context) {
    static_cast<MdnsDiscovery*>(context)->handleRecord(record);
}

void MdnsDiscovery::handleRecord(const DnsRecord& record) {
    switch ((DnsType)record.type) {
        case DnsType::PTR: {
            int service = -1;
            for (int i = 0; i < NUM_MDNS_SERVICE_TYPES; i++) {
                if (equalsNoCase(record.name, MDNS_SERVICE_TYPES[i])) {
                    service = i;
                    break;
                }
            }
            if (service < 0 || findInstance(record.target) != nullptr) return;
            if (_instanceCount >= MDNS_MAX_INSTANCES) {
                LOG_DEBUG("MDNS", "Instance table full, dropping %s", record.target);
                return;
            }
            Instance& inst = _instances[_instanceCount++];
            memset(&inst, 0, sizeof(inst));
            copyString(inst.name, sizeof(inst.name), record.target);
            inst.service = service;
            LOG_DEBUG("MDNS", "Instance %s", inst.name);
            break;
        }
        case DnsType::SRV: {
            Instance* inst = findInstance(record.name);
            if (inst == nullptr || inst->haveSrv) return;
            copyString(inst->host, sizeof(inst->host), record.target);
            inst->port = record.port;
            inst->haveSrv = true;
            if (findHost(inst->host) == nullptr && addHost(inst->host) == nullptr) {
                LOG_DEBUG("MDNS", "Host table full, dropping %s", inst->host);
            }
            break;
        }
        case DnsType::TXT: {
            Instance* inst = findInstance(record.name);
            if (inst == nullptr) return;
            char lines[400];
            txtRdataToLines(record.rdata, record.rdataLength, lines, sizeof(lines));
            TxtPair pairs[MDNS_MAX_TXT_PAIRS];
            int count = parseTxtLines(lines, pairs, MDNS_MAX_TXT_PAIRS);
            for (int i = 0; i < count; i++) {
                TxtPair* slot = nullptr;
                for (int j = 0; j < inst->txtCount; j++) {
                    if (strcmp(inst->txt[j].key, pairs[i].key) == 0) slot = &inst->txt[j];
                }
                if (slot == nullptr && inst->txtCount < MDNS_MAX_TXT_PAIRS) {
                    slot = &inst->txt[inst->txtCount++];
                }
                if (slot != nullptr) *slot = pairs[i];
            }
            inst->haveTxt = true;
            break;
        }
        case DnsType::A: {
            Host* host = findHost(record.name);
            if (host != nullptr && host->address[0] == '\0') {
                copyString(host->address, sizeof(host->address), record.address);
            }
            break;
        }
        default:
            break;
    }
}

void MdnsDiscovery::emitReady(bool force) {
    for (int i = 0; i < _instanceCount; i++) {
        Instance& inst = _instances[i];
        if (inst.emitted || !inst.haveSrv) continue;
        if (!inst.haveTxt && !force) continue;

        Host* host = findHost(inst.host);
        if (host == nullptr || host->address[0] == '\0') continue;

        const char* serviceType = MDNS_SERVICE_TYPES[inst.service];

        DiscoveredDevice device;
        initDevice(device);
        setField(device.address, sizeof(device.address), host->address);
        device.method = DiscoveryMethod::MDNS;
        device.port = inst.port;

        const char* fn = findTxtValue(inst.txt, inst.txtCount, "fn");
        if (fn != nullptr && fn[0] != '\0') {
            setField(device.displayName, sizeof(device.displayName), fn);
        } else {
            size_t labelLen = strcspn(inst.host, ".");
            copyTrimmed(device.displayName, sizeof(device.displayName), inst.host, labelLen);
        }

        const char* mfr = findTxtValue(inst.txt, inst.txtCount, "ma");
        if (mfr == nullptr) mfr = findTxtValue(inst.txt, inst.txtCount, "vendor");
        if (mfr == nullptr) mfr = inferManufacturer(serviceType);
        setField(device.manufacturer, sizeof(device.manufacturer), mfr);

        const char* model = findTxtValue(inst.txt, inst.txtCount, "md");
        if (model == nullptr) model = findTxtValue(inst.txt, inst.txtCount, "model");
        setField(device.modelName, sizeof(device.modelName), model);

        mdnsServiceLabel(serviceType, device.serviceType, sizeof(device.serviceType));

        inst.emitted = true;
        if (!emit(device)) return;
    }
}

MdnsDiscovery::Instance* MdnsDiscovery::findInstance(const char* name) {
    for (int i = 0; i < _instanceCount; i++) {
        if (equalsNoCase(_instances[i].name, name)) return &_instances[i];
    }
    return nullptr;
}

MdnsDiscovery::Host* MdnsDiscovery::findHost(const char* name) {
    for (int i = 0; i < _hostCount; i++) {
        if (equalsNoCase(_hosts[i].name, name)) return &_hosts[i];
    }
    return nullptr;
}

MdnsDiscovery::Host* MdnsDiscovery::addHost(const char* name) {
    if (_hostCount >= MDNS_MAX_HOSTS) return nullptr;
    Host& host = _hosts[_hostCount++];
    copyString(host.name, sizeof(host.name), name);
    host.address[0] = '\0';
    host.followUps = 0;
    return &host;
}

void MdnsDiscovery::cleanup() {
    if (_socket != INVALID_HANDLE) {
        _transport.close(_socket);
        _socket = INVALID_HANDLE;
    }
}

} // namespace tvscout
