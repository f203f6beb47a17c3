#pragma once
#include <cstddef>
#include <cstdint>
#include "../devices/discovered_device.h"

namespace tvscout {

enum class DiscoveryError : uint8_t {
    NONE             = 0,
    TRANSPORT        = 1,  // socket open/bind/send failure
    PROTOCOL         = 2,  // malformed response, skipped
    VALIDATION       = 3,  // bad code payload
    TIMEOUT          = 4,  // single-target resolution ran out of time
    NO_RESPONSE      = 5,  // single target never answered
    INVALID_ARGUMENT = 6,  // bad options (target address, ports)
    CAPACITY         = 7   // no free sockets / table full
};

const char* discoveryErrorToString(DiscoveryError error);

static const int MAX_PROBE_PORTS = 8;
static const size_t CODE_PAYLOAD_LEN = 512;

struct DiscoveryOptions {
    unsigned long timeoutMs;          // 0 = no session timeout
    uint16_t ports[MAX_PROBE_PORTS];  // port sweep targets, in order
    int portCount;
    char targetAddress[ADDRESS_LEN];  // direct-IP target
    char localAddress[ADDRESS_LEN];   // interface address (sweep subnet)
    char networkName[NETWORK_NAME_LEN];
    char codePayload[CODE_PAYLOAD_LEN];  // pre-captured code, may be empty
};

void initOptions(DiscoveryOptions& options);
bool addPort(DiscoveryOptions& options, uint16_t port);

// Receives everything a discoverer produces
class DeviceSink {
public:
    virtual ~DeviceSink() {}
    virtual void onDevice(DiscoveryMethod method, const DiscoveredDevice& device) = 0;
    virtual void onError(DiscoveryMethod method, DiscoveryError error, const char* message) = 0;
    // Exactly once per session, after the last onDevice/onError
    virtual void onComplete(DiscoveryMethod method) = 0;
};

// One discovery protocol. A session runs from start() until stop(), the
// session timeout, or the protocol running out of work. poll() advances
// it without blocking.
class Discoverer {
public:
    virtual ~Discoverer() {}

    // Starting while a session is active cleans up the old session first;
    // the old session produces no further events, not even onComplete.
    // Returns false if the session could not start (already reported).
    bool start(const DiscoveryOptions& options, unsigned long nowMs);

    void poll(unsigned long nowMs);

    // Idempotent; a no-op after the session already ended
    void stop();

    // End the session as if its own timeout fired: onTimeout, then stop
    void expire();

    bool isActive() const { return _active; }
    virtual DiscoveryMethod method() const = 0;

    void setSink(DeviceSink* sink) { _sink = sink; }

protected:
    Discoverer();

    virtual bool onStart(const DiscoveryOptions& options, unsigned long nowMs) = 0;
    virtual void onPoll(unsigned long nowMs) = 0;
    // Session timeout fired; called while still active, before cleanup
    virtual void onTimeout() {}
    // Release every socket and in-flight request. Must be idempotent.
    virtual void cleanup() = 0;

    // Deliver a device. Returns false if the session is no longer active
    // (including when the sink stopped it from inside the callback).
    bool emit(const DiscoveredDevice& device);
    void emitError(DiscoveryError error, const char* fmt, ...);

    unsigned long sessionStartMs() const { return _startMs; }

private:
    DeviceSink* _sink;
    bool _active;
    unsigned long _startMs;
    unsigned long _timeoutMs;
};

} // namespace tvscout
