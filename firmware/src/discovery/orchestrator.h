#pragma once
#include "../network/transport.h"
#include "discoverer.h"
#include "ssdp_discovery.h"
#include "mdns_discovery.h"
#include "port_sweep.h"
#include "direct_ip.h"
#include "code_reader.h"
#include "reconcile.h"

namespace tvscout {

enum class DiscoveryMode : uint8_t {
    NETWORK   = 0,  // SSDP + mDNS, then the port sweep
    DIRECT_IP = 1,
    CODE_SCAN = 2
};

enum class FinishReason : uint8_t {
    COMPLETED = 0,  // every active discoverer ran out of work
    TIMEOUT   = 1,
    STOPPED   = 2
};

const char* discoveryModeToString(DiscoveryMode mode);
bool discoveryModeFromString(const char* str, DiscoveryMode& mode);
const char* finishReasonToString(FinishReason reason);

// Consumer of the merged stream
class DiscoveryListener {
public:
    virtual ~DiscoveryListener() {}
    virtual void onDevice(const DiscoveredDevice& device, MergeAction action) = 0;
    virtual void onError(DiscoveryMethod method, DiscoveryError error, const char* message) = 0;
    // Exactly once per session; nothing follows it
    virtual void onFinished(FinishReason reason) = 0;
};

// Ports the network mode sweeps when the caller names none
static const uint16_t NETWORK_SWEEP_PORTS[] = { 1925, 1926, 8008, 8080 };
static const int NUM_NETWORK_SWEEP_PORTS = sizeof(NETWORK_SWEEP_PORTS) / sizeof(NETWORK_SWEEP_PORTS[0]);

// Runs the discoverers for one mode and merges what they find into a
// single per-address stream. Single-threaded: everything happens inside
// start(), poll(), submitCode() and stop().
class DiscoveryOrchestrator : public DeviceSink {
public:
    explicit DiscoveryOrchestrator(Transport& transport);

    void setListener(DiscoveryListener* listener) { _listener = listener; }

    // Ends any running session (STOPPED) before starting the new one.
    // Returns false when no discoverer could start; onFinished has fired.
    bool start(DiscoveryMode mode, const DiscoveryOptions& options, unsigned long nowMs);
    void poll(unsigned long nowMs);
    void stop();

    // Feed captured code text to a CODE_SCAN session
    SubmitResult submitCode(const char* raw);

    bool isRunning() const { return _running; }
    DiscoveryMode mode() const { return _mode; }
    const DeviceCache& devices() const { return _cache; }

    // DeviceSink
    void onDevice(DiscoveryMethod method, const DiscoveredDevice& device) override;
    void onError(DiscoveryMethod method, DiscoveryError error, const char* message) override;
    void onComplete(DiscoveryMethod method) override;

private:
    Discoverer* discovererFor(DiscoveryMethod method);
    void launch(DiscoveryMethod method);
    void expireAll();
    void stopAll();
    void checkCompleted();
    void finish(FinishReason reason);

    SsdpDiscovery _ssdp;
    MdnsDiscovery _mdns;
    PortSweep _sweep;
    DirectIpResolver _directIp;
    CodeReader _codeReader;

    DeviceCache _cache;
    DiscoveryOptions _options;
    DiscoveryListener* _listener;
    DiscoveryMode _mode;

    bool _running;
    bool _launching;     // start() is still bringing discoverers up
    bool _stopping;      // fan-out in progress, completions are expected
    bool _expiring;      // timeout fan-out, errors still reach the listener
    bool _sweepPending;  // network mode sweep not started yet
    uint8_t _activeMask; // bit per DiscoveryMethod still running
    unsigned long _startMs;
    unsigned long _nowMs;
};

} // namespace tvscout
