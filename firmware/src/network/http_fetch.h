#pragma once
#include <cstddef>
#include <cstdint>
#include "transport.h"
#include "../config.h"

namespace tvscout {

struct UrlParts {
    bool https;
    char host[64];
    uint16_t port;
    char path[128];
};

// Split "http(s)://host[:port]/path". Port defaults to 80 / 443, path to "/".
bool parseUrl(const char* url, UrlParts& parts);

enum class FetchResult : int8_t {
    FAILED  = -1,
    PENDING = 0,
    DONE    = 1
};

// One cooperative HTTP GET on top of the transport's HTTP client.
// begin() starts it, poll() advances it without blocking. Bodies longer
// than HTTP_BUFFER_SIZE - 1 are cut. The body stays valid until the next
// begin().
class HttpFetch {
public:
    HttpFetch();
    explicit HttpFetch(Transport& transport);
    ~HttpFetch();

    // For fetches held in arrays; must be set before begin()
    void setTransport(Transport& transport) { _transport = &transport; }

    bool begin(const char* url, unsigned long timeoutMs, unsigned long nowMs);
    FetchResult poll(unsigned long nowMs);
    void cancel();

    bool busy() const;
    bool timedOut() const { return _timedOut; }
    int status() const { return _status; }
    const char* body() const;
    size_t bodyLength() const { return _bodyLength; }
    const char* url() const { return _url; }

private:
    enum class State : uint8_t {
        IDLE    = 0,
        RUNNING = 1,
        DONE    = 2,
        FAILED  = 3
    };

    FetchResult fail(const char* reason);

    Transport* _transport;
    TransportHandle _handle;
    State _state;
    char _url[128];
    char _buffer[HTTP_BUFFER_SIZE];
    unsigned long _startMs;
    unsigned long _timeoutMs;
    bool _timedOut;
    int _status;
    size_t _bodyLength;
};

} // namespace tvscout
