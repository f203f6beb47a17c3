#pragma once
#include "discoverer.h"
#include "endpoint_resolver.h"
#include "../config.h"

namespace tvscout {

static const int SWEEP_FIRST_HOST = 1;
static const int SWEEP_LAST_HOST = 254;
static const int SWEEP_HOST_COUNT = SWEEP_LAST_HOST - SWEEP_FIRST_HOST + 1;

// "192.168.1.20" -> "192.168.1". Returns false for anything but a dotted quad.
bool subnetPrefix(const char* ip, char* output, size_t outputLen);

// prefix + "." + host
bool sweepHostAddress(const char* prefix, int host, char* output, size_t outputLen);

// Placeholder name shown while a probed host is being identified
void placeholderName(const char* ip, char* output, size_t outputLen);

// TCP connect sweep of the local /24. The first open port of a host
// produces a placeholder record right away, then the port's resolver runs
// and a successful identification produces a second record.
class PortSweep : public Discoverer {
public:
    explicit PortSweep(Transport& transport);
    ~PortSweep() override;

    DiscoveryMethod method() const override { return DiscoveryMethod::PORT_PROBE; }

    int hostsReleased() const { return _released; }
    int hostsOpen() const { return _openHosts; }

protected:
    bool onStart(const DiscoveryOptions& options, unsigned long nowMs) override;
    void onPoll(unsigned long nowMs) override;
    void cleanup() override;

private:
    enum class HostState : uint8_t {
        WAITING         = 0,  // batch not released yet
        CONNECTING      = 1,
        RESOLVE_PENDING = 2,  // open port found, waiting for a resolver
        RESOLVING       = 3,
        DONE            = 4
    };

    struct HostProbe {
        HostState state;
        uint8_t portIndex;
        TransportHandle handle;
        unsigned long connectStartMs;
        uint16_t openPort;
    };

    void releaseBatches(unsigned long nowMs);
    void advanceConnect(int index, unsigned long nowMs);
    void onPortOpen(int index);
    void assignResolvers(unsigned long nowMs);
    void pollResolvers(unsigned long nowMs);
    bool allDone() const;
    void hostAddress(int index, char* output, size_t outputLen) const;

    Transport& _transport;
    char _prefix[ADDRESS_LEN];
    uint16_t _ports[MAX_PROBE_PORTS];
    int _portCount;
    HostProbe _hosts[SWEEP_HOST_COUNT];
    int _released;
    int _openHosts;
    unsigned long _lastBatchMs;
    EndpointResolver _resolvers[PROBE_RESOLVER_SLOTS];
    int _resolverHost[PROBE_RESOLVER_SLOTS];  // host index, -1 when idle
};

} // namespace tvscout
