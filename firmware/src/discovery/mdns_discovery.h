#pragma once
#include "discoverer.h"
#include "../config.h"
#include "../network/transport.h"
#include "../protocols/dns_message.h"

namespace tvscout {

// Browsed in this order, one window each
extern const char* const MDNS_SERVICE_TYPES[];
extern const int NUM_MDNS_SERVICE_TYPES;

// "_googlecast._tcp.local" -> "Googlecast"
void mdnsServiceLabel(const char* serviceType, char* output, size_t outputLen);

// Vendor implied by the service type when TXT has none
const char* inferManufacturer(const char* serviceType);

static const int MDNS_MAX_TXT_PAIRS = 6;
static const int MDNS_MAX_FOLLOW_UPS = 4;

// Browse each service type with PTR queries, then chase SRV, TXT and A
// records for every instance found. Queries are legacy unicast (sent from
// an ephemeral port), so answers come straight back to our socket.
class MdnsDiscovery : public Discoverer {
public:
    explicit MdnsDiscovery(Transport& transport);
    ~MdnsDiscovery() override;

    DiscoveryMethod method() const override { return DiscoveryMethod::MDNS; }

    int instanceCount() const { return _instanceCount; }

protected:
    bool onStart(const DiscoveryOptions& options, unsigned long nowMs) override;
    void onPoll(unsigned long nowMs) override;
    void cleanup() override;

private:
    struct Instance {
        char name[DNS_NAME_LEN];
        int service;
        char host[DNS_NAME_LEN];
        uint16_t port;
        bool haveSrv;
        bool haveTxt;
        TxtPair txt[MDNS_MAX_TXT_PAIRS];
        int txtCount;
        bool emitted;
        uint8_t followUps;
    };

    struct Host {
        char name[DNS_NAME_LEN];
        char address[ADDRESS_LEN];
        uint8_t followUps;
    };

    static void visitRecord(const DnsRecord& record, void* context);
    void handleRecord(const DnsRecord& record);

    void beginService(unsigned long nowMs);
    void sendQuery(const char* name, DnsType type);
    void sendFollowUps();
    void receive();
    // Emit instances that are ready; with force, those missing only TXT too
    void emitReady(bool force);

    Instance* findInstance(const char* name);
    Host* findHost(const char* name);
    Host* addHost(const char* name);

    Transport& _transport;
    TransportHandle _socket;
    uint16_t _queryId;
    int _service;             // index into MDNS_SERVICE_TYPES, past end when done
    unsigned long _serviceStartMs;
    unsigned long _lastFollowUpMs;
    Instance _instances[MDNS_MAX_INSTANCES];
    int _instanceCount;
    Host _hosts[MDNS_MAX_HOSTS];
    int _hostCount;
    uint8_t _packet[1500];
};

} // namespace tvscout
