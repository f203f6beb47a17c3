#pragma once
#include <cstdint>

namespace tvscout {

struct BackoffConfig {
    unsigned long initialMs;
    unsigned long maxMs;
    int multiplier;  // per failure, typically 2
};

// Wi-Fi rejoin: 1s doubling up to 30s
extern const BackoffConfig WIFI_BACKOFF;

// Next interval after a failure: min(currentMs * multiplier, maxMs)
unsigned long backoffNext(unsigned long currentMs, const BackoffConfig& config);

// True once intervalMs has passed since lastAttemptMs (wrap-safe)
bool backoffReady(unsigned long lastAttemptMs, unsigned long nowMs, unsigned long intervalMs);

// Failures needed before the interval reaches maxMs
int backoffStepsToMax(const BackoffConfig& config);

// Retry pacing for one resource
class Backoff {
public:
    explicit Backoff(const BackoffConfig& config);

    void reset();
    // An attempt at nowMs just failed
    void fail(unsigned long nowMs);
    bool ready(unsigned long nowMs) const;

    unsigned long intervalMs() const { return _intervalMs; }
    int failures() const { return _failures; }

private:
    BackoffConfig _config;
    unsigned long _intervalMs;
    unsigned long _lastFailureMs;
    int _failures;
};

} // namespace tvscout
