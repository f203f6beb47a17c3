#include "port_sweep.h"
#include "../debug_log.h"
#include "../util/text.h"
#include <cstdio>
#include <cstring>

namespace tvscout {

bool subnetPrefix(const char* ip, char* output, size_t outputLen) {
    if (!isValidIpv4(ip)) return false;
    const char* lastDot = strrchr(ip, '.');
    size_t len = (size_t)(lastDot - ip);
    if (len >= outputLen) return false;
    memcpy(output, ip, len);
    output[len] = '\0';
    return true;
}

bool sweepHostAddress(const char* prefix, int host, char* output, size_t outputLen) {
    if (prefix == nullptr || host < 0 || host > 255) return false;
    int n = snprintf(output, outputLen, "%s.%d", prefix, host);
    return n > 0 && (size_t)n < outputLen;
}

void placeholderName(const char* ip, char* output, size_t outputLen) {
    snprintf(output, outputLen, "Identifying (%s)...", ip);
}

PortSweep::PortSweep(Transport& transport)
    : _transport(transport), _portCount(0), _released(0), _openHosts(0), _lastBatchMs(0) {
    _prefix[0] = '\0';
    for (int i = 0; i < SWEEP_HOST_COUNT; i++) {
        _hosts[i].state = HostState::DONE;
        _hosts[i].handle = INVALID_HANDLE;
    }
    for (int i = 0; i < PROBE_RESOLVER_SLOTS; i++) {
        _resolvers[i].setTransport(transport);
        _resolverHost[i] = -1;
    }
}

PortSweep::~PortSweep() {
    cleanup();
}

void PortSweep::hostAddress(int index, char* output, size_t outputLen) const {
    sweepHostAddress(_prefix, index + SWEEP_FIRST_HOST, output, outputLen);
}

bool PortSweep::onStart(const DiscoveryOptions& options, unsigned long nowMs) {
    if (options.portCount <= 0) {
        emitError(DiscoveryError::INVALID_ARGUMENT, "No ports to probe");
        return false;
    }
    if (!subnetPrefix(options.localAddress, _prefix, sizeof(_prefix))) {
        emitError(DiscoveryError::INVALID_ARGUMENT,
                  "No usable local IPv4 address to derive the subnet from");
        return false;
    }

    _portCount = options.portCount;
    for (int i = 0; i < _portCount; i++) _ports[i] = options.ports[i];

    char ip[ADDRESS_LEN];
    for (int i = 0; i < SWEEP_HOST_COUNT; i++) {
        HostProbe& h = _hosts[i];
        h.portIndex = 0;
        h.handle = INVALID_HANDLE;
        h.connectStartMs = 0;
        h.openPort = 0;
        hostAddress(i, ip, sizeof(ip));
        h.state = strcmp(ip, options.localAddress) == 0 ? HostState::DONE : HostState::WAITING;
    }
    for (int i = 0; i < PROBE_RESOLVER_SLOTS; i++) _resolverHost[i] = -1;

    _released = 0;
    _openHosts = 0;
    _lastBatchMs = nowMs;

    LOG_INFO("PROBE", "Sweeping %s.%d-%d on %d port(s)", _prefix,
             SWEEP_FIRST_HOST, SWEEP_LAST_HOST, _portCount);

    releaseBatches(nowMs);
    return true;
}

void PortSweep::releaseBatches(unsigned long nowMs) {
    if (_released >= SWEEP_HOST_COUNT) return;
    if (_released > 0 && nowMs - _lastBatchMs < PROBE_BATCH_DELAY_MS) return;

    int end = _released + PROBE_BATCH_SIZE;
    if (end > SWEEP_HOST_COUNT) end = SWEEP_HOST_COUNT;
    for (int i = _released; i < end; i++) {
        if (_hosts[i].state == HostState::WAITING) {
            _hosts[i].state = HostState::CONNECTING;
        }
    }
    _released = end;
    _lastBatchMs = nowMs;
}

void PortSweep::onPoll(unsigned long nowMs) {
    releaseBatches(nowMs);

    for (int i = 0; i < SWEEP_HOST_COUNT && isActive(); i++) {
        if (_hosts[i].state == HostState::CONNECTING) {
            advanceConnect(i, nowMs);
        }
    }
    if (!isActive()) return;

    pollResolvers(nowMs);
    if (!isActive()) return;
    assignResolvers(nowMs);

    if (allDone()) {
        LOG_INFO("PROBE", "Sweep finished, %d host(s) answered", _openHosts);
        stop();
    }
}

void PortSweep::advanceConnect(int index, unsigned long nowMs) {
    HostProbe& h = _hosts[index];
    char ip[ADDRESS_LEN];
    hostAddress(index, ip, sizeof(ip));

    if (h.handle == INVALID_HANDLE) {
        h.handle = _transport.tcpOpen(ip, _ports[h.portIndex]);
        if (h.handle == INVALID_HANDLE) return;  // out of sockets, retry next poll
        h.connectStartMs = nowMs;
    }

    IoStatus st = _transport.tcpPoll(h.handle);
    if (st == IoStatus::OPEN) {
        _transport.close(h.handle);
        h.handle = INVALID_HANDLE;
        h.openPort = _ports[h.portIndex];
        onPortOpen(index);
        return;
    }

    if (st == IoStatus::FAILED || nowMs - h.connectStartMs >= PROBE_CONNECT_TIMEOUT_MS) {
        _transport.close(h.handle);
        h.handle = INVALID_HANDLE;
        h.portIndex++;
        if (h.portIndex >= _portCount) h.state = HostState::DONE;
    }
}

void PortSweep::onPortOpen(int index) {
    HostProbe& h = _hosts[index];
    _openHosts++;

    DiscoveredDevice device;
    initDevice(device);
    hostAddress(index, device.address, sizeof(device.address));
    placeholderName(device.address, device.displayName, sizeof(device.displayName));
    device.method = DiscoveryMethod::PORT_PROBE;
    device.port = h.openPort;
    setField(device.serviceType, sizeof(device.serviceType), serviceTypeForPort(h.openPort));

    LOG_DEBUG("PROBE", "%s:%u open", device.address, h.openPort);

    h.state = resolverForPort(h.openPort) == ResolverKind::NONE
              ? HostState::DONE : HostState::RESOLVE_PENDING;
    emit(device);
}

void PortSweep::assignResolvers(unsigned long nowMs) {
    for (int slot = 0; slot < PROBE_RESOLVER_SLOTS; slot++) {
        if (_resolverHost[slot] >= 0) continue;

        int pick = -1;
        for (int i = 0; i < SWEEP_HOST_COUNT; i++) {
            if (_hosts[i].state == HostState::RESOLVE_PENDING) {
                pick = i;
                break;
            }
        }
        if (pick < 0) return;

        char ip[ADDRESS_LEN];
        hostAddress(pick, ip, sizeof(ip));
        uint16_t port = _hosts[pick].openPort;
        if (_resolvers[slot].begin(resolverForPort(port), ip, port, DiscoveryMethod::PORT_PROBE,
                                   PROBE_HTTP_TIMEOUT_MS, nowMs)) {
            _hosts[pick].state = HostState::RESOLVING;
            _resolverHost[slot] = pick;
        } else {
            LOG_DEBUG("PROBE", "Resolver for %s:%u could not start", ip, port);
            _hosts[pick].state = HostState::DONE;
        }
    }
}

void PortSweep::pollResolvers(unsigned long nowMs) {
    for (int slot = 0; slot < PROBE_RESOLVER_SLOTS && isActive(); slot++) {
        int index = _resolverHost[slot];
        if (index < 0) continue;

        FetchResult r = _resolvers[slot].poll(nowMs);
        if (r == FetchResult::PENDING) continue;

        _resolverHost[slot] = -1;
        _hosts[index].state = HostState::DONE;
        if (r == FetchResult::DONE) {
            emit(_resolvers[slot].device());
        }
    }
}

bool PortSweep::allDone() const {
    if (_released < SWEEP_HOST_COUNT) return false;
    for (int i = 0; i < SWEEP_HOST_COUNT; i++) {
        if (_hosts[i].state != HostState::DONE) return false;
    }
    return true;
}

void PortSweep::cleanup() {
    for (int i = 0; i < SWEEP_HOST_COUNT; i++) {
        if (_hosts[i].handle != INVALID_HANDLE) {
            _transport.close(_hosts[i].handle);
            _hosts[i].handle = INVALID_HANDLE;
        }
    }
    for (int i = 0; i < PROBE_RESOLVER_SLOTS; i++) {
        _resolvers[i].cancel();
        _resolverHost[i] = -1;
    }
}

} // namespace tvscout
