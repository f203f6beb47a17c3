#pragma once
#include <cstddef>
#include <cstdint>
#include "../devices/discovered_device.h"
#include "../network/http_fetch.h"

namespace tvscout {

// Which identification endpoint family to ask, keyed by the open port
enum class ResolverKind : uint8_t {
    NONE             = 0,
    JOINTSPACE       = 1,  // Philips REST /N/system, JSON
    DIAL             = 2,  // cast receivers, /ssdp/device-desc.xml
    GENERIC_HTTP     = 3,  // unclassified HTTP port, common description paths
    UPNP_DESCRIPTION = 4   // single description document for direct lookups
};

ResolverKind resolverForPort(uint16_t port);
const char* resolverKindToString(ResolverKind kind);

// URL of the given step of the plan for kind. Returns false when the plan
// has no such step.
bool resolverEndpoint(ResolverKind kind, const char* ip, uint16_t port, int step,
                      char* url, size_t urlLen);

// Description document path a device usually serves on port
const char* upnpDescriptionPath(uint16_t port);

// Short service label for an open port, used by placeholder records
const char* serviceTypeForPort(uint16_t port);

// JointSpace /system JSON -> name, Philips, model, "JointSpace TV".
// Returns false for anything that is not a JSON object.
bool parseJointSpaceSystem(const char* json, DiscoveredDevice& device);

// Fill device from a 200 response body fetched for kind. address, port
// and method are left to the caller.
bool resolveFromBody(ResolverKind kind, const char* url, const char* body,
                     DiscoveredDevice& device);

// Walks the endpoint plan for one host over HttpFetch, one request at a
// time, stopping at the first response that identifies the device.
class EndpointResolver {
public:
    EndpointResolver();
    explicit EndpointResolver(Transport& transport);

    void setTransport(Transport& transport) { _fetch.setTransport(transport); }

    bool begin(ResolverKind kind, const char* ip, uint16_t port, DiscoveryMethod method,
               unsigned long requestTimeoutMs, unsigned long nowMs);

    // DONE: device() holds the result. FAILED: plan exhausted.
    FetchResult poll(unsigned long nowMs);

    void cancel();
    bool busy() const { return _busy; }

    // True if at least one request of the last plan timed out
    bool sawTimeout() const { return _sawTimeout; }

    const DiscoveredDevice& device() const { return _device; }
    const char* address() const { return _ip; }

private:
    bool startStep(unsigned long nowMs);

    HttpFetch _fetch;
    ResolverKind _kind;
    int _step;
    char _ip[ADDRESS_LEN];
    uint16_t _port;
    DiscoveryMethod _method;
    unsigned long _requestTimeoutMs;
    bool _busy;
    bool _sawTimeout;
    DiscoveredDevice _device;
};

} // namespace tvscout
