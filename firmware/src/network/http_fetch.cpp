#include "http_fetch.h"
#include "../debug_log.h"
#include "../util/text.h"
#include <cstring>

namespace tvscout {

bool parseUrl(const char* url, UrlParts& parts) {
    if (url == nullptr) return false;

    memset(&parts, 0, sizeof(parts));
    const char* p = url;
    if (startsWith(p, "http://")) {
        parts.https = false;
        p += 7;
    } else if (startsWith(p, "https://")) {
        parts.https = true;
        p += 8;
    } else {
        return false;
    }

    size_t hostLen = strcspn(p, ":/");
    if (hostLen == 0 || hostLen >= sizeof(parts.host)) return false;
    memcpy(parts.host, p, hostLen);
    parts.host[hostLen] = '\0';
    p += hostLen;

    parts.port = parts.https ? 443 : 80;
    if (*p == ':') {
        p++;
        long port = 0;
        int digits = 0;
        while (*p >= '0' && *p <= '9') {
            port = port * 10 + (*p - '0');
            if (port > 65535) return false;
            p++;
            digits++;
        }
        if (digits == 0 || port == 0) return false;
        parts.port = (uint16_t)port;
    }

    if (*p == '\0') {
        strcpy(parts.path, "/");
    } else if (*p == '/') {
        if (!copyString(parts.path, sizeof(parts.path), p)) return false;
    } else {
        return false;
    }
    return true;
}

HttpFetch::HttpFetch()
    : _transport(nullptr), _handle(INVALID_HANDLE), _state(State::IDLE),
      _startMs(0), _timeoutMs(0), _timedOut(false), _status(0), _bodyLength(0) {
    _url[0] = '\0';
    _buffer[0] = '\0';
}

HttpFetch::HttpFetch(Transport& transport)
    : _transport(&transport), _handle(INVALID_HANDLE), _state(State::IDLE),
      _startMs(0), _timeoutMs(0), _timedOut(false), _status(0), _bodyLength(0) {
    _url[0] = '\0';
    _buffer[0] = '\0';
}

HttpFetch::~HttpFetch() {
    cancel();
}

bool HttpFetch::begin(const char* url, unsigned long timeoutMs, unsigned long nowMs) {
    cancel();

    _status = 0;
    _bodyLength = 0;
    _timedOut = false;
    _buffer[0] = '\0';
    copyString(_url, sizeof(_url), url);

    UrlParts parts;
    if (_transport == nullptr || !parseUrl(url, parts)) {
        LOG_DEBUG("HTTP", "Bad URL: %s", url ? url : "(null)");
        _state = State::FAILED;
        return false;
    }

    _handle = _transport->httpGet(url, timeoutMs, _buffer, sizeof(_buffer));
    if (_handle == INVALID_HANDLE) {
        LOG_DEBUG("HTTP", "No request slot for %s", _url);
        _state = State::FAILED;
        return false;
    }

    _startMs = nowMs;
    _timeoutMs = timeoutMs;
    _state = State::RUNNING;
    LOG_TRACE("HTTP", "GET %s", _url);
    return true;
}

void HttpFetch::cancel() {
    if (_handle != INVALID_HANDLE) {
        _transport->close(_handle);
        _handle = INVALID_HANDLE;
    }
    if (_state != State::DONE) {
        _state = State::IDLE;
    }
}

bool HttpFetch::busy() const {
    return _state == State::RUNNING;
}

const char* HttpFetch::body() const {
    if (_state != State::DONE) return "";
    return _buffer;
}

FetchResult HttpFetch::fail(const char* reason) {
    LOG_TRACE("HTTP", "%s: %s", _url, reason);
    if (_handle != INVALID_HANDLE) {
        _transport->close(_handle);
        _handle = INVALID_HANDLE;
    }
    _state = State::FAILED;
    return FetchResult::FAILED;
}

FetchResult HttpFetch::poll(unsigned long nowMs) {
    switch (_state) {
        case State::DONE:    return FetchResult::DONE;
        case State::RUNNING: break;
        default:             return FetchResult::FAILED;
    }

    if (nowMs - _startMs >= _timeoutMs) {
        _timedOut = true;
        return fail("timeout");
    }

    IoStatus st = _transport->httpPoll(_handle);
    if (st == IoStatus::PENDING) return FetchResult::PENDING;
    if (st == IoStatus::FAILED) return fail("request failed");

    int status = 0;
    size_t length = 0;
    if (!_transport->httpResult(_handle, status, length)) {
        return fail("no result");
    }
    _transport->close(_handle);
    _handle = INVALID_HANDLE;

    if (length >= sizeof(_buffer)) length = sizeof(_buffer) - 1;
    _buffer[length] = '\0';
    _status = status;
    _bodyLength = length;
    _state = State::DONE;
    LOG_TRACE("HTTP", "%s -> %d (%u bytes)", _url, _status, (unsigned)_bodyLength);
    return FetchResult::DONE;
}

} // namespace tvscout
