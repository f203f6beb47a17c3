#pragma once
#include "discoverer.h"
#include "../config.h"
#include "../network/http_fetch.h"
#include "../protocols/ssdp.h"

namespace tvscout {

// M-SEARCH every SSDP_SEARCH_INTERVAL_MS, then fetch the LOCATION
// description of each new responder. Runs until stopped or timed out.
class SsdpDiscovery : public Discoverer {
public:
    explicit SsdpDiscovery(Transport& transport);
    ~SsdpDiscovery() override;

    DiscoveryMethod method() const override { return DiscoveryMethod::SSDP; }

    // Addresses that already won a description fetch this session
    int processedCount() const { return _processedCount; }

protected:
    bool onStart(const DiscoveryOptions& options, unsigned long nowMs) override;
    void onPoll(unsigned long nowMs) override;
    void cleanup() override;

private:
    struct FetchSlot {
        HttpFetch fetch;
        bool busy;
        char ip[ADDRESS_LEN];
        ProtocolHeader headers[MAX_PROTOCOL_HEADERS];
        int headerCount;
    };

    void sendSearches();
    void receiveResponses(unsigned long nowMs);
    void handleResponse(const char* ip, const char* raw, size_t len, unsigned long nowMs);
    void pollFetches(unsigned long nowMs);
    bool finishFetch(FetchSlot& slot);
    bool alreadyProcessed(const char* ip) const;
    FetchSlot* freeSlot();

    Transport& _transport;
    TransportHandle _socket;
    unsigned long _lastSearchMs;
    char _processed[MAX_TRACKED_DEVICES][ADDRESS_LEN];
    int _processedCount;
    FetchSlot _slots[SSDP_FETCH_SLOTS];
    char _packet[1536];
};

} // namespace tvscout
