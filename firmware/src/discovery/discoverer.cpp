#include "discoverer.h"
#include "../debug_log.h"
#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace tvscout {

const char* discoveryErrorToString(DiscoveryError error) {
    switch (error) {
        case DiscoveryError::NONE:             return "none";
        case DiscoveryError::TRANSPORT:        return "transport";
        case DiscoveryError::PROTOCOL:         return "protocol";
        case DiscoveryError::VALIDATION:       return "validation";
        case DiscoveryError::TIMEOUT:          return "timeout";
        case DiscoveryError::NO_RESPONSE:      return "no_response";
        case DiscoveryError::INVALID_ARGUMENT: return "invalid_argument";
        case DiscoveryError::CAPACITY:         return "capacity";
        default:                               return "unknown";
    }
}

void initOptions(DiscoveryOptions& options) {
    memset(&options, 0, sizeof(options));
}

bool addPort(DiscoveryOptions& options, uint16_t port) {
    if (port == 0 || options.portCount >= MAX_PROBE_PORTS) return false;
    options.ports[options.portCount++] = port;
    return true;
}

Discoverer::Discoverer()
    : _sink(nullptr), _active(false), _startMs(0), _timeoutMs(0) {}

bool Discoverer::start(const DiscoveryOptions& options, unsigned long nowMs) {
    if (_active) {
        LOG_DEBUG("DISC", "%s restarted, dropping previous session",
                  discoveryMethodToString(method()));
        cleanup();
        _active = false;
    }

    _active = true;
    _startMs = nowMs;
    _timeoutMs = options.timeoutMs;

    if (!onStart(options, nowMs)) {
        stop();
        return false;
    }
    return _active;
}

void Discoverer::poll(unsigned long nowMs) {
    if (!_active) return;

    if (_timeoutMs > 0 && nowMs - _startMs >= _timeoutMs) {
        expire();
        return;
    }

    onPoll(nowMs);
}

void Discoverer::expire() {
    if (!_active) return;

    LOG_DEBUG("DISC", "%s session timed out", discoveryMethodToString(method()));
    onTimeout();
    stop();
}

void Discoverer::stop() {
    if (!_active) return;

    cleanup();
    _active = false;

    if (_sink != nullptr) {
        _sink->onComplete(method());
    }
}

bool Discoverer::emit(const DiscoveredDevice& device) {
    if (!_active) return false;

    if (_sink != nullptr) {
        _sink->onDevice(method(), device);
    }
    return _active;
}

void Discoverer::emitError(DiscoveryError error, const char* fmt, ...) {
    if (!_active) return;

    char message[192];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    LOG_DEBUG("DISC", "%s error (%s): %s", discoveryMethodToString(method()),
              discoveryErrorToString(error), message);

    if (_sink != nullptr) {
        _sink->onError(method(), error, message);
    }
}

} // namespace tvscout
