#include "backoff.h"

namespace tvscout {

const BackoffConfig WIFI_BACKOFF = {
    1000,   // initialMs
    30000,  // maxMs
    2       // multiplier
};

unsigned long backoffNext(unsigned long currentMs, const BackoffConfig& config) {
    if (currentMs == 0) return config.maxMs > 0 ? 1 : 0;
    if (config.multiplier <= 1) return currentMs;

    unsigned long next = currentMs * (unsigned long)config.multiplier;
    if (next / (unsigned long)config.multiplier != currentMs) {
        return config.maxMs;  // overflow
    }
    return next > config.maxMs ? config.maxMs : next;
}

bool backoffReady(unsigned long lastAttemptMs, unsigned long nowMs, unsigned long intervalMs) {
    return nowMs - lastAttemptMs >= intervalMs;
}

int backoffStepsToMax(const BackoffConfig& config) {
    if (config.initialMs == 0 || config.multiplier <= 1) return 0;

    int steps = 0;
    unsigned long current = config.initialMs;
    while (current < config.maxMs) {
        current = backoffNext(current, config);
        steps++;
    }
    return steps;
}

Backoff::Backoff(const BackoffConfig& config)
    : _config(config), _intervalMs(0), _lastFailureMs(0), _failures(0) {}

void Backoff::reset() {
    _intervalMs = 0;
    _failures = 0;
}

void Backoff::fail(unsigned long nowMs) {
    _intervalMs = _failures == 0 ? _config.initialMs : backoffNext(_intervalMs, _config);
    _failures++;
    _lastFailureMs = nowMs;
}

bool Backoff::ready(unsigned long nowMs) const {
    if (_failures == 0) return true;
    return backoffReady(_lastFailureMs, nowMs, _intervalMs);
}

} // namespace tvscout
