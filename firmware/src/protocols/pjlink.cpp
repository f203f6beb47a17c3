#include "pjlink.h"
#include "../config.h"
#include "../debug_log.h"
#include "../util/text.h"
#include <cstring>
#include <cstdlib>

namespace tvscout {

bool parsePjlinkGreeting(const char* line, PjlinkAuth& auth, char* random, size_t randomLen) {
    if (line == nullptr || !startsWith(line, "PJLINK ")) return false;

    const char* rest = line + 7;
    if (random != nullptr && randomLen > 0) random[0] = '\0';

    if (startsWith(rest, "ERRA")) {
        auth = PjlinkAuth::ERROR;
        return true;
    }
    if (rest[0] == '0' && (rest[1] == '\0' || rest[1] == '\r')) {
        auth = PjlinkAuth::NONE;
        return true;
    }
    if (rest[0] == '1' && rest[1] == ' ') {
        auth = PjlinkAuth::REQUIRED;
        if (random != nullptr && randomLen > 0) {
            const char* seed = rest + 2;
            copyTrimmed(random, randomLen, seed, strlen(seed));
        }
        return true;
    }
    return false;
}

int formatPjlinkQuery(int pjClass, const char* command, char* output, size_t outputLen) {
    if (command == nullptr || strlen(command) != 4) return -1;
    if (pjClass < 1 || pjClass > 9) return -1;
    // "%1NAME ?\r" is 9 characters
    if (outputLen < 10) return -1;

    output[0] = '%';
    output[1] = (char)('0' + pjClass);
    memcpy(output + 2, command, 4);
    memcpy(output + 6, " ?\r", 3);
    output[9] = '\0';
    return 9;
}

bool parsePjlinkResponse(const char* line, int& pjClass, char* command, size_t commandLen,
                         char* value, size_t valueLen, bool& isError) {
    if (line == nullptr || line[0] != '%') return false;
    if (line[1] < '1' || line[1] > '9') return false;
    if (strlen(line) < 7 || line[6] != '=') return false;
    if (commandLen < 5) return false;

    pjClass = line[1] - '0';
    memcpy(command, line + 2, 4);
    command[4] = '\0';

    const char* v = line + 7;
    size_t len = strlen(v);
    while (len > 0 && (v[len - 1] == '\r' || v[len - 1] == '\n')) len--;
    copyTrimmed(value, valueLen, v, len);

    isError = strcmp(value, "ERR1") == 0 || strcmp(value, "ERR2") == 0 ||
              strcmp(value, "ERR3") == 0 || strcmp(value, "ERR4") == 0 ||
              strcmp(value, "ERRA") == 0;
    return true;
}

int takePjlinkLine(char* buf, size_t& bufLen, char* line, size_t lineLen) {
    size_t end = 0;
    while (end < bufLen && buf[end] != '\r' && buf[end] != '\n') end++;
    if (end >= bufLen) return -1;

    size_t copyLen = end < lineLen - 1 ? end : lineLen - 1;
    memcpy(line, buf, copyLen);
    line[copyLen] = '\0';

    size_t consumed = end + 1;
    if (buf[end] == '\r' && consumed < bufLen && buf[consumed] == '\n') consumed++;
    memmove(buf, buf + consumed, bufLen - consumed);
    bufLen -= consumed;
    return (int)copyLen;
}

PjlinkProbe::PjlinkProbe()
    : _transport(nullptr), _handle(INVALID_HANDLE), _step(Step::IDLE), _startMs(0),
      _timeoutMs(0), _timedOut(false), _greeted(false), _rxLen(0) {
    memset(&_info, 0, sizeof(_info));
}

PjlinkProbe::PjlinkProbe(Transport& transport) : PjlinkProbe() {
    _transport = &transport;
}

PjlinkProbe::~PjlinkProbe() {
    cancel();
}

bool PjlinkProbe::begin(const char* ip, unsigned long timeoutMs, unsigned long nowMs) {
    cancel();
    memset(&_info, 0, sizeof(_info));
    _rxLen = 0;
    _timedOut = false;
    _greeted = false;

    if (_transport == nullptr) return false;

    _handle = _transport->tcpOpen(ip, PJLINK_PORT);
    if (_handle == INVALID_HANDLE) {
        _step = Step::FAILED;
        return false;
    }

    LOG_DEBUG("PJLINK", "Connecting to %s:%d", ip, PJLINK_PORT);
    _startMs = nowMs;
    _timeoutMs = timeoutMs;
    _step = Step::CONNECTING;
    return true;
}

void PjlinkProbe::cancel() {
    if (_handle != INVALID_HANDLE && _transport != nullptr) {
        _transport->close(_handle);
    }
    _handle = INVALID_HANDLE;
    if (_step != Step::DONE) _step = Step::IDLE;
}

FetchResult PjlinkProbe::finish(bool identified) {
    if (_handle != INVALID_HANDLE) {
        _transport->close(_handle);
        _handle = INVALID_HANDLE;
    }
    _step = identified ? Step::DONE : Step::FAILED;
    return identified ? FetchResult::DONE : FetchResult::FAILED;
}

bool PjlinkProbe::sendQuery(int pjClass, const char* command) {
    char query[16];
    int len = formatPjlinkQuery(pjClass, command, query, sizeof(query));
    if (len < 0) return false;

    LOG_TRACE("PJLINK", "Sending: %%%d%s ?", pjClass, command);
    // Queries are a few bytes; a short write on a fresh socket is a failure
    return _transport->tcpSend(_handle, (const uint8_t*)query, (size_t)len) == len;
}

// Returns false when the exchange is over
bool PjlinkProbe::handleLine(const char* line) {
    LOG_TRACE("PJLINK", "Response: %s", line);

    if (_step == Step::GREETING) {
        PjlinkAuth auth;
        if (!parsePjlinkGreeting(line, auth, nullptr, 0)) {
            _step = Step::FAILED;
            return false;
        }
        _greeted = true;
        if (auth != PjlinkAuth::NONE) {
            // Password protected: identified as a projector, details withheld
            _info.authRequired = true;
            _step = Step::DONE;
            return false;
        }
        _info.pjClass = 1;
        _step = Step::CLASS;
        return sendQuery(1, "CLSS");
    }

    int pjClass = 0;
    char command[8];
    char value[64];
    bool isError = false;
    if (!parsePjlinkResponse(line, pjClass, command, sizeof(command), value, sizeof(value), isError)) {
        return true;  // noise between responses
    }

    switch (_step) {
        case Step::CLASS:
            if (strcmp(command, "CLSS") != 0) return true;
            if (!isError) _info.pjClass = atoi(value) >= 2 ? 2 : 1;
            _step = Step::NAME;
            return sendQuery(1, "NAME");
        case Step::NAME:
            if (strcmp(command, "NAME") != 0) return true;
            if (!isError) copyString(_info.name, sizeof(_info.name), value);
            _step = Step::MANUFACTURER;
            return sendQuery(1, "INF1");
        case Step::MANUFACTURER:
            if (strcmp(command, "INF1") != 0) return true;
            if (!isError) copyString(_info.manufacturer, sizeof(_info.manufacturer), value);
            _step = Step::MODEL;
            return sendQuery(1, "INF2");
        case Step::MODEL:
            if (strcmp(command, "INF2") != 0) return true;
            if (!isError) copyString(_info.model, sizeof(_info.model), value);
            if (_info.pjClass >= 2) {
                _step = Step::SERIAL;
                return sendQuery(2, "SNUM");
            }
            _step = Step::DONE;
            return false;
        case Step::SERIAL:
            if (strcmp(command, "SNUM") != 0) return true;
            if (!isError) copyString(_info.serial, sizeof(_info.serial), value);
            _step = Step::DONE;
            return false;
        default:
            return false;
    }
}

FetchResult PjlinkProbe::poll(unsigned long nowMs) {
    switch (_step) {
        case Step::DONE:   return FetchResult::DONE;
        case Step::FAILED: return FetchResult::FAILED;
        case Step::IDLE:   return FetchResult::FAILED;
        default:           break;
    }

    if (nowMs - _startMs >= _timeoutMs) {
        _timedOut = true;
        // A projector that greeted us is identified even if a query stalled
        LOG_DEBUG("PJLINK", "Timeout%s", _greeted ? " after greeting" : "");
        return finish(_greeted);
    }

    if (_step == Step::CONNECTING) {
        IoStatus st = _transport->tcpPoll(_handle);
        if (st == IoStatus::FAILED) return finish(false);
        if (st == IoStatus::PENDING) return FetchResult::PENDING;
        _step = Step::GREETING;
    }

    int n = _transport->tcpReceive(_handle, (uint8_t*)_rx + _rxLen, sizeof(_rx) - 1 - _rxLen);
    if (n == IO_CLOSED || n < 0) {
        return finish(_greeted);
    }
    _rxLen += (size_t)n;

    char line[128];
    while (takePjlinkLine(_rx, _rxLen, line, sizeof(line)) >= 0) {
        if (line[0] == '\0') continue;
        if (!handleLine(line)) {
            return finish(_step == Step::DONE || _greeted);
        }
    }

    // Line longer than the buffer: not PJLink
    if (_rxLen >= sizeof(_rx) - 1) return finish(_greeted);

    return FetchResult::PENDING;
}

} // namespace tvscout
