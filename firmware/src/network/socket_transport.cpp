#include "socket_transport.h"
#include "../debug_log.h"
#include "../util/text.h"
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

#ifdef ARDUINO
#include <lwip/sockets.h>
#else
#include <sys/socket.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#endif

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace tvscout {

// Copies what fits into the caller's buffer and drops the rest
static void appendBody(HttpRequest& req, const char* data, size_t len) {
    if (req.body == nullptr || req.bodyLen == 0) return;
    size_t room = req.bodyLen - 1 - req.received;
    size_t take = len < room ? len : room;
    memcpy(req.body + req.received, data, take);
    req.received += take;
    req.body[req.received] = '\0';
}

#ifdef ARDUINO
static esp_err_t onHttpEvent(esp_http_client_event_t* evt) {
    if (evt->event_id == HTTP_EVENT_ON_DATA && evt->user_data != nullptr) {
        appendBody(*(HttpRequest*)evt->user_data, (const char*)evt->data,
                   (size_t)evt->data_len);
    }
    return ESP_OK;
}
#else
static size_t onCurlWrite(char* data, size_t size, size_t count, void* userdata) {
    size_t len = size * count;
    appendBody(*(HttpRequest*)userdata, data, len);
    return len;
}
#endif

static bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static bool toSockAddr(const char* ip, uint16_t port, struct sockaddr_in& addr) {
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    return inet_pton(AF_INET, ip, &addr.sin_addr) == 1;
}

SocketTransport::SocketTransport() : _open(0) {
    memset(_slots, 0, sizeof(_slots));
    for (int i = 0; i < TRANSPORT_MAX_SOCKETS; i++) {
        _slots[i].fd = -1;
        _slots[i].state = SlotState::FREE;
    }
    _interfaceAddress[0] = '\0';

#ifndef ARDUINO
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        LOG_ERROR("HTTP", "curl_global_init failed: %s", curl_easy_strerror(rc));
    }
    _multi = curl_multi_init();
    if (_multi == nullptr) {
        LOG_ERROR("HTTP", "curl_multi_init failed");
    }
#endif
}

SocketTransport::~SocketTransport() {
    closeAll();
#ifndef ARDUINO
    if (_multi != nullptr) curl_multi_cleanup(_multi);
    curl_global_cleanup();
#endif
}

void SocketTransport::setInterfaceAddress(const char* ip) {
    copyString(_interfaceAddress, sizeof(_interfaceAddress), ip);
}

SocketTransport::Slot* SocketTransport::slotFor(TransportHandle h) {
    if (h < 0 || h >= TRANSPORT_MAX_SOCKETS) return nullptr;
    if (_slots[h].state == SlotState::FREE) return nullptr;
    return &_slots[h];
}

TransportHandle SocketTransport::allocate(int fd, SlotState state) {
    for (int i = 0; i < TRANSPORT_MAX_SOCKETS; i++) {
        if (_slots[i].state == SlotState::FREE) {
            _slots[i].fd = fd;
            _slots[i].state = state;
            memset(&_slots[i].http, 0, sizeof(_slots[i].http));
            _open++;
            return i;
        }
    }
    return INVALID_HANDLE;
}

TransportHandle SocketTransport::udpOpen(uint16_t localPort, const char* multicastGroup) {
    if (_open >= TRANSPORT_MAX_SOCKETS) {
        LOG_DEBUG("NET", "No free socket slot for UDP");
        return INVALID_HANDLE;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        LOG_ERROR("NET", "UDP socket() failed: errno %d", errno);
        return INVALID_HANDLE;
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in bindAddr;
    memset(&bindAddr, 0, sizeof(bindAddr));
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_addr.s_addr = htonl(INADDR_ANY);
    bindAddr.sin_port = htons(localPort);
    if (::bind(fd, (struct sockaddr*)&bindAddr, sizeof(bindAddr)) != 0) {
        LOG_ERROR("NET", "UDP bind to port %u failed: errno %d", localPort, errno);
        ::close(fd);
        return INVALID_HANDLE;
    }

    struct in_addr ifAddr;
    ifAddr.s_addr = htonl(INADDR_ANY);
    if (_interfaceAddress[0] != '\0') {
        inet_pton(AF_INET, _interfaceAddress, &ifAddr);
        setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &ifAddr, sizeof(ifAddr));
    }

    unsigned char ttl = 4;
    setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    if (multicastGroup != nullptr) {
        struct ip_mreq mreq;
        memset(&mreq, 0, sizeof(mreq));
        if (inet_pton(AF_INET, multicastGroup, &mreq.imr_multiaddr) != 1) {
            LOG_ERROR("NET", "Bad multicast group %s", multicastGroup);
            ::close(fd);
            return INVALID_HANDLE;
        }
        mreq.imr_interface = ifAddr;
        if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) != 0) {
            LOG_ERROR("NET", "Join %s failed: errno %d", multicastGroup, errno);
            ::close(fd);
            return INVALID_HANDLE;
        }
    }

    if (!setNonBlocking(fd)) {
        LOG_ERROR("NET", "UDP non-blocking mode failed: errno %d", errno);
        ::close(fd);
        return INVALID_HANDLE;
    }

    TransportHandle h = allocate(fd, SlotState::UDP);
    if (h == INVALID_HANDLE) ::close(fd);
    return h;
}

bool SocketTransport::udpSendTo(TransportHandle h, const char* ip, uint16_t port,
                                const uint8_t* data, size_t len) {
    Slot* slot = slotFor(h);
    if (slot == nullptr || slot->state != SlotState::UDP) return false;

    struct sockaddr_in dest;
    if (!toSockAddr(ip, port, dest)) return false;

    ssize_t n = ::sendto(slot->fd, data, len, 0, (struct sockaddr*)&dest, sizeof(dest));
    if (n < 0) {
        LOG_DEBUG("NET", "sendto %s:%u failed: errno %d", ip, port, errno);
        return false;
    }
    return (size_t)n == len;
}

int SocketTransport::udpReceive(TransportHandle h, uint8_t* buf, size_t bufLen,
                                char* fromIp, size_t fromIpLen) {
    Slot* slot = slotFor(h);
    if (slot == nullptr || slot->state != SlotState::UDP) return -1;

    struct sockaddr_in from;
    socklen_t fromLen = sizeof(from);
    ssize_t n = ::recvfrom(slot->fd, buf, bufLen, 0, (struct sockaddr*)&from, &fromLen);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
        return -1;
    }

    if (fromIp != nullptr && fromIpLen > 0) {
        if (inet_ntop(AF_INET, &from.sin_addr, fromIp, fromIpLen) == nullptr) {
            fromIp[0] = '\0';
        }
    }
    return (int)n;
}

TransportHandle SocketTransport::tcpOpen(const char* ip, uint16_t port) {
    if (_open >= TRANSPORT_MAX_SOCKETS) return INVALID_HANDLE;

    struct sockaddr_in dest;
    if (!toSockAddr(ip, port, dest)) {
        LOG_ERROR("NET", "Bad address %s", ip);
        return INVALID_HANDLE;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        LOG_DEBUG("NET", "TCP socket() failed: errno %d", errno);
        return INVALID_HANDLE;
    }

    if (!setNonBlocking(fd)) {
        ::close(fd);
        return INVALID_HANDLE;
    }

    SlotState state = SlotState::CONNECTING;
    int rc = ::connect(fd, (struct sockaddr*)&dest, sizeof(dest));
    if (rc != 0 && errno != EINPROGRESS) {
        // Refused straight away: report through tcpPoll like any other failure
        state = SlotState::FAILED;
    }

    TransportHandle h = allocate(fd, state);
    if (h == INVALID_HANDLE) ::close(fd);
    return h;
}

IoStatus SocketTransport::tcpPoll(TransportHandle h) {
    Slot* slot = slotFor(h);
    if (slot == nullptr) return IoStatus::FAILED;

    switch (slot->state) {
        case SlotState::OPEN:
            return IoStatus::OPEN;
        case SlotState::CONNECTING:
            break;
        default:
            return IoStatus::FAILED;
    }

    fd_set writeSet;
    FD_ZERO(&writeSet);
    FD_SET(slot->fd, &writeSet);
    struct timeval zero = {0, 0};
    int ready = ::select(slot->fd + 1, nullptr, &writeSet, nullptr, &zero);
    if (ready < 0) {
        slot->state = SlotState::FAILED;
        return IoStatus::FAILED;
    }
    if (ready == 0) return IoStatus::PENDING;

    int soError = 0;
    socklen_t errLen = sizeof(soError);
    if (getsockopt(slot->fd, SOL_SOCKET, SO_ERROR, &soError, &errLen) != 0 || soError != 0) {
        slot->state = SlotState::FAILED;
        return IoStatus::FAILED;
    }

    slot->state = SlotState::OPEN;
    return IoStatus::OPEN;
}

int SocketTransport::tcpSend(TransportHandle h, const uint8_t* data, size_t len) {
    Slot* slot = slotFor(h);
    if (slot == nullptr || slot->state != SlotState::OPEN) return -1;

    ssize_t n = ::send(slot->fd, data, len, MSG_NOSIGNAL);
    if (n >= 0) return (int)n;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
    return -1;
}

int SocketTransport::tcpReceive(TransportHandle h, uint8_t* buf, size_t bufLen) {
    Slot* slot = slotFor(h);
    if (slot == nullptr || slot->state != SlotState::OPEN) return -1;

    ssize_t n = ::recv(slot->fd, buf, bufLen, 0);
    if (n > 0) return (int)n;
    if (n == 0) return IO_CLOSED;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
    return -1;
}

#ifdef ARDUINO

TransportHandle SocketTransport::httpGet(const char* url, unsigned long timeoutMs,
                                         char* body, size_t bodyLen) {
    if (_open >= TRANSPORT_MAX_SOCKETS || body == nullptr || bodyLen == 0) {
        return INVALID_HANDLE;
    }

    TransportHandle h = allocate(-1, SlotState::HTTP);
    if (h == INVALID_HANDLE) return INVALID_HANDLE;
    HttpRequest& req = _slots[h].http;
    req.body = body;
    req.bodyLen = bodyLen;
    body[0] = '\0';

    esp_http_client_config_t config = {};
    config.url = url;
    config.timeout_ms = (int)timeoutMs;
    config.user_agent = USER_AGENT;
    config.is_async = true;
    config.event_handler = onHttpEvent;
    config.user_data = &req;
    config.skip_cert_common_name_check = true;

    req.client = esp_http_client_init(&config);
    if (req.client == NULL) {
        LOG_ERROR("HTTP", "HTTP client init failed for %s", url);
        release(_slots[h]);
        return INVALID_HANDLE;
    }
    return h;
}

void SocketTransport::advanceHttp(Slot& slot) {
    esp_err_t err = esp_http_client_perform(slot.http.client);
    if (err == ESP_ERR_HTTP_EAGAIN) return;
    if (err != ESP_OK) {
        LOG_DEBUG("HTTP", "Request failed: %s", esp_err_to_name(err));
        slot.state = SlotState::FAILED;
        return;
    }
    slot.http.status = esp_http_client_get_status_code(slot.http.client);
    slot.state = SlotState::HTTP_DONE;
}

void SocketTransport::release(Slot& slot) {
    if (slot.http.client != NULL) {
        esp_http_client_cleanup(slot.http.client);
        slot.http.client = NULL;
    }
    if (slot.fd >= 0) ::close(slot.fd);
    slot.fd = -1;
    slot.state = SlotState::FREE;
    _open--;
}

#else

TransportHandle SocketTransport::httpGet(const char* url, unsigned long timeoutMs,
                                         char* body, size_t bodyLen) {
    if (_multi == nullptr || _open >= TRANSPORT_MAX_SOCKETS ||
        body == nullptr || bodyLen == 0) {
        return INVALID_HANDLE;
    }

    TransportHandle h = allocate(-1, SlotState::HTTP);
    if (h == INVALID_HANDLE) return INVALID_HANDLE;
    HttpRequest& req = _slots[h].http;
    req.body = body;
    req.bodyLen = bodyLen;
    body[0] = '\0';

    req.easy = curl_easy_init();
    if (req.easy == nullptr) {
        LOG_ERROR("HTTP", "curl_easy_init failed for %s", url);
        release(_slots[h]);
        return INVALID_HANDLE;
    }

    curl_easy_setopt(req.easy, CURLOPT_URL, url);
    curl_easy_setopt(req.easy, CURLOPT_WRITEFUNCTION, onCurlWrite);
    curl_easy_setopt(req.easy, CURLOPT_WRITEDATA, &req);
    curl_easy_setopt(req.easy, CURLOPT_PRIVATE, &_slots[h]);
    curl_easy_setopt(req.easy, CURLOPT_TIMEOUT_MS, (long)timeoutMs);
    curl_easy_setopt(req.easy, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(req.easy, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(req.easy, CURLOPT_SSL_VERIFYHOST, 0L);
    curl_easy_setopt(req.easy, CURLOPT_NOSIGNAL, 1L);

    CURLMcode rc = curl_multi_add_handle(_multi, req.easy);
    if (rc != CURLM_OK) {
        LOG_ERROR("HTTP", "curl_multi_add_handle failed: %s", curl_multi_strerror(rc));
        release(_slots[h]);
        return INVALID_HANDLE;
    }
    return h;
}

// One multi pass drives every transfer; finished ones are marked on their slot
void SocketTransport::advanceHttp(Slot& slot) {
    (void)slot;
    int running = 0;
    CURLMcode rc = curl_multi_perform(_multi, &running);
    if (rc != CURLM_OK) {
        LOG_ERROR("HTTP", "curl_multi_perform failed: %s", curl_multi_strerror(rc));
    }

    int queued = 0;
    CURLMsg* msg;
    while ((msg = curl_multi_info_read(_multi, &queued)) != nullptr) {
        if (msg->msg != CURLMSG_DONE) continue;

        char* priv = nullptr;
        curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
        Slot* done = (Slot*)priv;
        if (done == nullptr || done->state != SlotState::HTTP) continue;

        if (msg->data.result != CURLE_OK) {
            LOG_DEBUG("HTTP", "Request failed: %s", curl_easy_strerror(msg->data.result));
            done->state = SlotState::FAILED;
            continue;
        }
        long code = 0;
        curl_easy_getinfo(msg->easy_handle, CURLINFO_RESPONSE_CODE, &code);
        done->http.status = (int)code;
        done->state = SlotState::HTTP_DONE;
    }
}

void SocketTransport::release(Slot& slot) {
    if (slot.http.easy != nullptr) {
        curl_multi_remove_handle(_multi, slot.http.easy);
        curl_easy_cleanup(slot.http.easy);
        slot.http.easy = nullptr;
    }
    if (slot.fd >= 0) ::close(slot.fd);
    slot.fd = -1;
    slot.state = SlotState::FREE;
    _open--;
}

#endif

IoStatus SocketTransport::httpPoll(TransportHandle h) {
    Slot* slot = slotFor(h);
    if (slot == nullptr) return IoStatus::FAILED;

    if (slot->state == SlotState::HTTP) advanceHttp(*slot);

    switch (slot->state) {
        case SlotState::HTTP:      return IoStatus::PENDING;
        case SlotState::HTTP_DONE: return IoStatus::OPEN;
        default:                   return IoStatus::FAILED;
    }
}

bool SocketTransport::httpResult(TransportHandle h, int& status, size_t& bodyLength) {
    Slot* slot = slotFor(h);
    if (slot == nullptr || slot->state != SlotState::HTTP_DONE) return false;
    status = slot->http.status;
    bodyLength = slot->http.received;
    return true;
}

void SocketTransport::close(TransportHandle h) {
    Slot* slot = slotFor(h);
    if (slot == nullptr) return;
    release(*slot);
}

int SocketTransport::openHandles() const {
    return _open;
}

void SocketTransport::closeAll() {
    for (int i = 0; i < TRANSPORT_MAX_SOCKETS; i++) {
        close(i);
    }
}

} // namespace tvscout
