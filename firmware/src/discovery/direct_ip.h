#pragma once
#include "discoverer.h"
#include "endpoint_resolver.h"
#include "../protocols/pjlink.h"

namespace tvscout {

// Description document ports, most likely first
extern const uint16_t DIRECT_IP_UPNP_PORTS[];
extern const int NUM_DIRECT_IP_UPNP_PORTS;

// Last resort: any of these open makes a minimally identified device
extern const uint16_t DIRECT_IP_REACH_PORTS[];
extern const int NUM_DIRECT_IP_REACH_PORTS;

// Build the record for an identified projector
void pjlinkToDevice(const char* ip, const PjlinkInfo& info, DiscoveredDevice& device);

// Identify one address typed by the user. Steps run in order and the
// first success ends the session: PJLink, UPnP description documents,
// JointSpace, raw reachability. At most one record is emitted; if every
// step fails the session ends with a single error.
class DirectIpResolver : public Discoverer {
public:
    explicit DirectIpResolver(Transport& transport);
    ~DirectIpResolver() override;

    DiscoveryMethod method() const override { return DiscoveryMethod::DIRECT_IP; }

protected:
    bool onStart(const DiscoveryOptions& options, unsigned long nowMs) override;
    void onPoll(unsigned long nowMs) override;
    void onTimeout() override;
    void cleanup() override;

private:
    enum class Step : uint8_t {
        PJLINK       = 0,
        UPNP         = 1,
        JOINTSPACE   = 2,
        REACHABILITY = 3,
        EXHAUSTED    = 4
    };

    // Start the current step at _index, skipping ones that cannot start
    void startStep(unsigned long nowMs);
    void nextStep(unsigned long nowMs);
    void pollReachability(unsigned long nowMs);
    void succeed(const DiscoveredDevice& device);

    Transport& _transport;
    PjlinkProbe _pjlink;
    EndpointResolver _resolver;
    Step _step;
    int _index;
    TransportHandle _probe;
    unsigned long _probeStartMs;
    char _target[ADDRESS_LEN];
};

} // namespace tvscout
