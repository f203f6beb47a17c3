#pragma once
#include <cstddef>
#include <cstdint>

namespace tvscout {

typedef int TransportHandle;

static const TransportHandle INVALID_HANDLE = -1;

// tcpReceive() result when the peer closed the connection
static const int IO_CLOSED = -2;

enum class IoStatus : uint8_t {
    PENDING = 0,  // connect or HTTP request still in progress
    OPEN    = 1,  // connected, or HTTP response complete
    FAILED  = 2
};

// Non-blocking socket and HTTP operations the discoverers are written against.
// Nothing here may block: every call returns immediately and the caller
// polls again on its next tick.
class Transport {
public:
    virtual ~Transport() {}

    // UDP socket bound to localPort (0 = any). When multicastGroup is set
    // the socket joins it on the discovery interface.
    virtual TransportHandle udpOpen(uint16_t localPort,
                                    const char* multicastGroup = nullptr) = 0;

    virtual bool udpSendTo(TransportHandle h, const char* ip, uint16_t port,
                           const uint8_t* data, size_t len) = 0;

    // Returns datagram length, 0 when nothing is waiting, -1 on error
    virtual int udpReceive(TransportHandle h, uint8_t* buf, size_t bufLen,
                           char* fromIp, size_t fromIpLen) = 0;

    // Start a TCP connect. Returns INVALID_HANDLE when no socket could be
    // allocated right now.
    virtual TransportHandle tcpOpen(const char* ip, uint16_t port) = 0;

    virtual IoStatus tcpPoll(TransportHandle h) = 0;

    // Returns bytes accepted (may be short), -1 on error
    virtual int tcpSend(TransportHandle h, const uint8_t* data, size_t len) = 0;

    // Returns bytes read, 0 when nothing is waiting, IO_CLOSED, or -1 on error
    virtual int tcpReceive(TransportHandle h, uint8_t* buf, size_t bufLen) = 0;

    // Start an HTTP or HTTPS GET. The response body is written into body as
    // it arrives, NUL-terminated and cut at bodyLen - 1 bytes; body must stay
    // valid until the handle is closed. Certificates are not verified.
    virtual TransportHandle httpGet(const char* url, unsigned long timeoutMs,
                                    char* body, size_t bodyLen) = 0;

    // PENDING while the request runs, OPEN once the response is complete
    virtual IoStatus httpPoll(TransportHandle h) = 0;

    // Status code and stored body length of a completed request
    virtual bool httpResult(TransportHandle h, int& status, size_t& bodyLength) = 0;

    // Safe to call with INVALID_HANDLE or an already-closed handle
    virtual void close(TransportHandle h) = 0;

    // Number of sockets and HTTP requests currently held open
    virtual int openHandles() const = 0;
};

} // namespace tvscout
