#include "direct_ip.h"
#include "../config.h"
#include "../debug_log.h"
#include "../util/text.h"
#include <cstdio>

namespace tvscout {

const uint16_t DIRECT_IP_UPNP_PORTS[] = {49152, 49153, 8080, 8008, 80, 1400, 9197};
const int NUM_DIRECT_IP_UPNP_PORTS = sizeof(DIRECT_IP_UPNP_PORTS) / sizeof(DIRECT_IP_UPNP_PORTS[0]);

static const uint16_t JOINTSPACE_PORTS[] = {1925, 1926};
static const int NUM_JOINTSPACE_PORTS = 2;

const uint16_t DIRECT_IP_REACH_PORTS[] = {
    1925, 1926, 8008, 8080, 80, 49152, 4352, 8001, 8002, 3000, 7000, 9197
};
const int NUM_DIRECT_IP_REACH_PORTS = sizeof(DIRECT_IP_REACH_PORTS) / sizeof(DIRECT_IP_REACH_PORTS[0]);

void pjlinkToDevice(const char* ip, const PjlinkInfo& info, DiscoveredDevice& device) {
    initDevice(device);
    setField(device.address, sizeof(device.address), ip);
    if (info.name[0] != '\0') {
        setField(device.displayName, sizeof(device.displayName), info.name);
    } else {
        snprintf(device.displayName, sizeof(device.displayName), "Projector at %s", ip);
    }
    device.method = DiscoveryMethod::DIRECT_IP;
    device.port = PJLINK_PORT;
    setField(device.manufacturer, sizeof(device.manufacturer), info.manufacturer);
    setField(device.modelName, sizeof(device.modelName), info.model);
    setField(device.serviceType, sizeof(device.serviceType), "PJLink Projector");

    setHeader(device, "PJLINK-CLASS", info.pjClass >= 2 ? "2" : "1");
    if (info.authRequired) setHeader(device, "PJLINK-AUTH", "1");
    if (info.serial[0] != '\0') setHeader(device, "SERIAL", info.serial);
}

DirectIpResolver::DirectIpResolver(Transport& transport)
    : _transport(transport), _pjlink(transport), _resolver(transport),
      _step(Step::PJLINK), _index(0), _probe(INVALID_HANDLE), _probeStartMs(0) {
    _target[0] = '\0';
}

DirectIpResolver::~DirectIpResolver() {
    cleanup();
}

bool DirectIpResolver::onStart(const DiscoveryOptions& options, unsigned long nowMs) {
    if (!isValidIpv4(options.targetAddress)) {
        emitError(DiscoveryError::INVALID_ARGUMENT, "\"%s\" is not a valid IPv4 address",
                  options.targetAddress);
        return false;
    }

    copyString(_target, sizeof(_target), options.targetAddress);
    LOG_INFO("IP", "Resolving %s", _target);

    _step = Step::PJLINK;
    _index = 0;
    startStep(nowMs);
    return true;
}

void DirectIpResolver::startStep(unsigned long nowMs) {
    while (isActive()) {
        switch (_step) {
            case Step::PJLINK:
                if (_pjlink.begin(_target, PJLINK_TIMEOUT_MS, nowMs)) return;
                _step = Step::UPNP;
                _index = 0;
                break;

            case Step::UPNP:
                if (_index >= NUM_DIRECT_IP_UPNP_PORTS) {
                    _step = Step::JOINTSPACE;
                    _index = 0;
                    break;
                }
                if (_resolver.begin(ResolverKind::UPNP_DESCRIPTION, _target,
                                    DIRECT_IP_UPNP_PORTS[_index], DiscoveryMethod::DIRECT_IP,
                                    DIRECT_IP_HTTP_TIMEOUT_MS, nowMs)) {
                    return;
                }
                _index++;
                break;

            case Step::JOINTSPACE:
                if (_index >= NUM_JOINTSPACE_PORTS) {
                    _step = Step::REACHABILITY;
                    _index = 0;
                    break;
                }
                if (_resolver.begin(ResolverKind::JOINTSPACE, _target, JOINTSPACE_PORTS[_index],
                                    DiscoveryMethod::DIRECT_IP, DIRECT_IP_HTTP_TIMEOUT_MS, nowMs)) {
                    return;
                }
                _index++;
                break;

            case Step::REACHABILITY:
                if (_index >= NUM_DIRECT_IP_REACH_PORTS) {
                    _step = Step::EXHAUSTED;
                    break;
                }
                _probe = _transport.tcpOpen(_target, DIRECT_IP_REACH_PORTS[_index]);
                if (_probe != INVALID_HANDLE) {
                    _probeStartMs = nowMs;
                    return;
                }
                _index++;
                break;

            case Step::EXHAUSTED:
            default:
                emitError(DiscoveryError::NO_RESPONSE,
                          "No response from %s. Check the address and make sure the "
                          "device is on the same Wi-Fi network.", _target);
                stop();
                return;
        }
    }
}

void DirectIpResolver::nextStep(unsigned long nowMs) {
    if (_step == Step::PJLINK) {
        _step = Step::UPNP;
        _index = 0;
    } else {
        _index++;
    }
    startStep(nowMs);
}

void DirectIpResolver::onPoll(unsigned long nowMs) {
    switch (_step) {
        case Step::PJLINK: {
            FetchResult r = _pjlink.poll(nowMs);
            if (r == FetchResult::PENDING) return;
            if (r == FetchResult::DONE) {
                DiscoveredDevice device;
                pjlinkToDevice(_target, _pjlink.info(), device);
                succeed(device);
                return;
            }
            LOG_DEBUG("IP", "%s: no PJLink", _target);
            nextStep(nowMs);
            return;
        }

        case Step::UPNP:
        case Step::JOINTSPACE: {
            FetchResult r = _resolver.poll(nowMs);
            if (r == FetchResult::PENDING) return;
            if (r == FetchResult::DONE) {
                succeed(_resolver.device());
                return;
            }
            nextStep(nowMs);
            return;
        }

        case Step::REACHABILITY:
            pollReachability(nowMs);
            return;

        default:
            return;
    }
}

void DirectIpResolver::pollReachability(unsigned long nowMs) {
    IoStatus st = _transport.tcpPoll(_probe);
    if (st == IoStatus::PENDING && nowMs - _probeStartMs < DIRECT_IP_CONNECT_TIMEOUT_MS) {
        return;
    }

    uint16_t port = DIRECT_IP_REACH_PORTS[_index];
    _transport.close(_probe);
    _probe = INVALID_HANDLE;

    if (st == IoStatus::OPEN) {
        DiscoveredDevice device;
        initDevice(device);
        setField(device.address, sizeof(device.address), _target);
        snprintf(device.displayName, sizeof(device.displayName), "Device at %s", _target);
        device.method = DiscoveryMethod::DIRECT_IP;
        device.port = port;
        succeed(device);
        return;
    }

    nextStep(nowMs);
}

void DirectIpResolver::succeed(const DiscoveredDevice& device) {
    LOG_INFO("IP", "%s identified as \"%s\"", _target, device.displayName);
    if (emit(device)) stop();
}

void DirectIpResolver::onTimeout() {
    emitError(DiscoveryError::TIMEOUT,
              "Connection to %s timed out. Make sure the device is on and on the "
              "same network.", _target);
}

void DirectIpResolver::cleanup() {
    _pjlink.cancel();
    _resolver.cancel();
    if (_probe != INVALID_HANDLE) {
        _transport.close(_probe);
        _probe = INVALID_HANDLE;
    }
}

} // namespace tvscout
