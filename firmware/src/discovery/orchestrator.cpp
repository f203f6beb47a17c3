#include "orchestrator.h"
#include "../debug_log.h"
#include "../util/text.h"
#include <cstring>

namespace tvscout {

const char* discoveryModeToString(DiscoveryMode mode) {
    switch (mode) {
        case DiscoveryMode::NETWORK:   return "network";
        case DiscoveryMode::DIRECT_IP: return "ip";
        case DiscoveryMode::CODE_SCAN: return "code";
        default:                       return "unknown";
    }
}

bool discoveryModeFromString(const char* str, DiscoveryMode& mode) {
    if (str == nullptr) return false;
    if (strcmp(str, "network") == 0) { mode = DiscoveryMode::NETWORK; return true; }
    if (strcmp(str, "ip") == 0)      { mode = DiscoveryMode::DIRECT_IP; return true; }
    if (strcmp(str, "code") == 0)    { mode = DiscoveryMode::CODE_SCAN; return true; }
    return false;
}

const char* finishReasonToString(FinishReason reason) {
    switch (reason) {
        case FinishReason::COMPLETED: return "completed";
        case FinishReason::TIMEOUT:   return "timeout";
        case FinishReason::STOPPED:   return "stopped";
        default:                      return "unknown";
    }
}

static uint8_t methodBit(DiscoveryMethod method) {
    return (uint8_t)(1u << (uint8_t)method);
}

DiscoveryOrchestrator::DiscoveryOrchestrator(Transport& transport)
    : _ssdp(transport), _mdns(transport), _sweep(transport),
      _directIp(transport), _codeReader(),
      _listener(nullptr), _mode(DiscoveryMode::NETWORK),
      _running(false), _launching(false), _stopping(false), _expiring(false),
      _sweepPending(false), _activeMask(0), _startMs(0), _nowMs(0) {
    initOptions(_options);
    _ssdp.setSink(this);
    _mdns.setSink(this);
    _sweep.setSink(this);
    _directIp.setSink(this);
    _codeReader.setSink(this);
}

Discoverer* DiscoveryOrchestrator::discovererFor(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::SSDP:       return &_ssdp;
        case DiscoveryMethod::MDNS:       return &_mdns;
        case DiscoveryMethod::PORT_PROBE: return &_sweep;
        case DiscoveryMethod::DIRECT_IP:  return &_directIp;
        case DiscoveryMethod::CODE_SCAN:  return &_codeReader;
        default:                          return nullptr;
    }
}

bool DiscoveryOrchestrator::start(DiscoveryMode mode, const DiscoveryOptions& options,
                                  unsigned long nowMs) {
    if (_running) {
        LOG_INFO("ORCH", "New session requested, stopping the current one");
        stop();
    }

    _cache.clear();
    _options = options;
    _mode = mode;
    _startMs = nowMs;
    _nowMs = nowMs;
    _running = true;
    _stopping = false;
    _sweepPending = false;
    _activeMask = 0;

    LOG_INFO("ORCH", "Starting %s discovery (timeout %lums)",
             discoveryModeToString(mode), options.timeoutMs);

    // Every planned source counts as active before any of them starts, so
    // one failing early cannot close the session under the others.
    _launching = true;
    switch (mode) {
        case DiscoveryMode::NETWORK:
            if (_options.portCount == 0) {
                for (int i = 0; i < NUM_NETWORK_SWEEP_PORTS; i++) {
                    addPort(_options, NETWORK_SWEEP_PORTS[i]);
                }
            }
            _activeMask = methodBit(DiscoveryMethod::SSDP) | methodBit(DiscoveryMethod::MDNS);
            _sweepPending = true;
            launch(DiscoveryMethod::SSDP);
            launch(DiscoveryMethod::MDNS);
            break;
        case DiscoveryMode::DIRECT_IP:
            _activeMask = methodBit(DiscoveryMethod::DIRECT_IP);
            launch(DiscoveryMethod::DIRECT_IP);
            break;
        case DiscoveryMode::CODE_SCAN:
            _activeMask = methodBit(DiscoveryMethod::CODE_SCAN);
            launch(DiscoveryMethod::CODE_SCAN);
            break;
    }
    _launching = false;

    if (!_running) return false;
    checkCompleted();
    return _running;
}

void DiscoveryOrchestrator::launch(DiscoveryMethod method) {
    if (!_running) return;
    Discoverer* discoverer = discovererFor(method);
    if (discoverer == nullptr) return;

    if (!discoverer->start(_options, _nowMs)) {
        LOG_ERROR("ORCH", "%s failed to start", discoveryMethodToString(method));
    }
}

void DiscoveryOrchestrator::poll(unsigned long nowMs) {
    if (!_running) return;
    _nowMs = nowMs;

    if (_options.timeoutMs > 0 && nowMs - _startMs >= _options.timeoutMs) {
        LOG_INFO("ORCH", "Discovery timeout reached (%lums)", _options.timeoutMs);
        expireAll();
        if (!_running) return;
        stopAll();
        finish(FinishReason::TIMEOUT);
        return;
    }

    if (_sweepPending && nowMs - _startMs >= PROBE_START_DELAY_MS) {
        _sweepPending = false;
        _activeMask |= methodBit(DiscoveryMethod::PORT_PROBE);
        LOG_DEBUG("ORCH", "Starting port sweep (%d ports)", _options.portCount);
        launch(DiscoveryMethod::PORT_PROBE);
        if (!_running) return;
        checkCompleted();
        if (!_running) return;
    }

    Discoverer* order[] = { &_ssdp, &_mdns, &_sweep, &_directIp, &_codeReader };
    for (Discoverer* discoverer : order) {
        if (!_running) return;
        discoverer->poll(nowMs);
    }
}

void DiscoveryOrchestrator::stop() {
    if (!_running) return;
    LOG_INFO("ORCH", "Stopping discovery, %d devices known", _cache.count());
    stopAll();
    finish(FinishReason::STOPPED);
}

void DiscoveryOrchestrator::expireAll() {
    _expiring = true;
    _sweepPending = false;
    Discoverer* order[] = { &_ssdp, &_mdns, &_sweep, &_directIp, &_codeReader };
    for (Discoverer* discoverer : order) {
        if (!_running) break;
        discoverer->expire();
    }
    _expiring = false;
}

void DiscoveryOrchestrator::stopAll() {
    _stopping = true;
    _sweepPending = false;
    _ssdp.stop();
    _mdns.stop();
    _sweep.stop();
    _directIp.stop();
    _codeReader.stop();
    _stopping = false;
}

SubmitResult DiscoveryOrchestrator::submitCode(const char* raw) {
    if (!_running || _mode != DiscoveryMode::CODE_SCAN) return SubmitResult::INACTIVE;
    return _codeReader.submit(raw);
}

void DiscoveryOrchestrator::onDevice(DiscoveryMethod method, const DiscoveredDevice& device) {
    if (!_running || _stopping) {
        LOG_TRACE("ORCH", "Dropping %s from %s, session closed", device.address,
                  discoveryMethodToString(method));
        return;
    }

    DiscoveredDevice incoming = device;
    if (_options.networkName[0] != '\0') {
        copyString(incoming.networkName, sizeof(incoming.networkName), _options.networkName);
    }
    incoming.firstSeenMs = _nowMs;

    DiscoveredDevice merged;
    MergeAction action = _cache.reconcile(incoming, merged);
    LOG_DEBUG("ORCH", "%s %s \"%s\" via %s", mergeActionToString(action), incoming.address,
              incoming.displayName, discoveryMethodToString(method));

    if (isEmission(action) && _listener != nullptr) {
        _listener->onDevice(merged, action);
    }
}

void DiscoveryOrchestrator::onError(DiscoveryMethod method, DiscoveryError error,
                                    const char* message) {
    if (!_running || _stopping) return;
    LOG_ERROR("ORCH", "[%s] %s: %s", discoveryMethodToString(method),
              discoveryErrorToString(error), message);
    if (_listener != nullptr) {
        _listener->onError(method, error, message);
    }
}

void DiscoveryOrchestrator::onComplete(DiscoveryMethod method) {
    _activeMask &= (uint8_t)~methodBit(method);
    LOG_DEBUG("ORCH", "%s finished", discoveryMethodToString(method));
    if (_stopping || _launching || _expiring) return;
    checkCompleted();
}

void DiscoveryOrchestrator::checkCompleted() {
    if (!_running || _activeMask != 0 || _sweepPending) return;
    LOG_INFO("ORCH", "All sources done, %d devices found", _cache.count());
    finish(FinishReason::COMPLETED);
}

void DiscoveryOrchestrator::finish(FinishReason reason) {
    if (!_running) return;
    _running = false;
    if (_listener != nullptr) {
        _listener->onFinished(reason);
    }
}

} // namespace tvscout
