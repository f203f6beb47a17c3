#pragma once
#include "transport.h"
#include "../config.h"

#ifdef ARDUINO
#include <esp_http_client.h>
#else
#include <curl/curl.h>
#endif

namespace tvscout {

// One in-flight HTTP GET; body points into the caller's buffer
struct HttpRequest {
#ifdef ARDUINO
    esp_http_client_handle_t client;
#else
    CURL* easy;
#endif
    char* body;
    size_t bodyLen;
    size_t received;
    int status;
};

// Transport over BSD sockets (Linux, or lwIP on the board). HTTP goes
// through esp_http_client in async mode on the board and the libcurl
// multi interface on the host. Certificates are not verified: the TVs
// that speak TLS on the LAN present self-signed certificates.
class SocketTransport : public Transport {
public:
    SocketTransport();
    ~SocketTransport() override;

    // Interface address used for multicast joins and sends (optional)
    void setInterfaceAddress(const char* ip);

    TransportHandle udpOpen(uint16_t localPort, const char* multicastGroup = nullptr) override;
    bool udpSendTo(TransportHandle h, const char* ip, uint16_t port,
                   const uint8_t* data, size_t len) override;
    int udpReceive(TransportHandle h, uint8_t* buf, size_t bufLen,
                   char* fromIp, size_t fromIpLen) override;

    TransportHandle tcpOpen(const char* ip, uint16_t port) override;
    IoStatus tcpPoll(TransportHandle h) override;
    int tcpSend(TransportHandle h, const uint8_t* data, size_t len) override;
    int tcpReceive(TransportHandle h, uint8_t* buf, size_t bufLen) override;

    TransportHandle httpGet(const char* url, unsigned long timeoutMs,
                            char* body, size_t bodyLen) override;
    IoStatus httpPoll(TransportHandle h) override;
    bool httpResult(TransportHandle h, int& status, size_t& bodyLength) override;

    void close(TransportHandle h) override;
    int openHandles() const override;

    // Close every socket and abort every request
    void closeAll();

private:
    enum class SlotState : uint8_t {
        FREE       = 0,
        UDP        = 1,
        CONNECTING = 2,
        OPEN       = 3,
        FAILED     = 4,
        HTTP       = 5,  // request in flight
        HTTP_DONE  = 6
    };

    struct Slot {
        int fd;
        SlotState state;
        HttpRequest http;
    };

    Slot* slotFor(TransportHandle h);
    TransportHandle allocate(int fd, SlotState state);
    void release(Slot& slot);
    void advanceHttp(Slot& slot);

    Slot _slots[TRANSPORT_MAX_SOCKETS];
    char _interfaceAddress[16];
    int _open;
#ifndef ARDUINO
    CURLM* _multi;
#endif
};

} // namespace tvscout
