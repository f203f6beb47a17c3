#pragma once
#include <cstddef>
#include <cstdint>
#include "../network/http_fetch.h"
#include "../network/transport.h"

namespace tvscout {

// PJLink projector status protocol: TCP 4352, '\r'-terminated lines.
// Formatting and parsing are testable without a projector.

enum class PjlinkAuth : uint8_t {
    NONE     = 0,  // "PJLINK 0"
    REQUIRED = 1,  // "PJLINK 1 <random>"
    ERROR    = 2   // "PJLINK ERRA"
};

// Parse the greeting sent on connect. random receives the seed for
// authenticated sessions (may be nullptr). Returns false for non-PJLink input.
bool parsePjlinkGreeting(const char* line, PjlinkAuth& auth, char* random, size_t randomLen);

// "%<class><command> ?\r". Returns length, or -1 if the buffer is too small
// or the command is not four characters.
int formatPjlinkQuery(int pjClass, const char* command, char* output, size_t outputLen);

// Parse "%1NAME=value". isError is set for ERR1..ERR4 and ERRA.
bool parsePjlinkResponse(const char* line, int& pjClass, char* command, size_t commandLen,
                         char* value, size_t valueLen, bool& isError);

// Pull the first '\r'-terminated line out of buf (a lone '\n' after it is
// dropped too). Returns the line length, or -1 if no full line is buffered.
int takePjlinkLine(char* buf, size_t& bufLen, char* line, size_t lineLen);

struct PjlinkInfo {
    int pjClass;           // 1 or 2, 0 when unknown
    bool authRequired;
    char name[64];
    char manufacturer[48];
    char model[48];
    char serial[48];
};

// One identification exchange: greeting, CLSS, NAME, INF1, INF2 and for
// class 2 also SNUM.
class PjlinkProbe {
public:
    PjlinkProbe();
    explicit PjlinkProbe(Transport& transport);
    ~PjlinkProbe();

    void setTransport(Transport& transport) { _transport = &transport; }

    bool begin(const char* ip, unsigned long timeoutMs, unsigned long nowMs);

    // DONE: info() describes the projector. FAILED: not a PJLink device,
    // or nothing answered in time (timedOut()).
    FetchResult poll(unsigned long nowMs);

    void cancel();
    bool timedOut() const { return _timedOut; }
    const PjlinkInfo& info() const { return _info; }

private:
    enum class Step : uint8_t {
        IDLE         = 0,
        CONNECTING   = 1,
        GREETING     = 2,
        CLASS        = 3,
        NAME         = 4,
        MANUFACTURER = 5,
        MODEL        = 6,
        SERIAL       = 7,
        DONE         = 8,
        FAILED       = 9
    };

    bool sendQuery(int pjClass, const char* command);
    bool handleLine(const char* line);
    bool nextQuery();
    FetchResult finish(bool identified);

    Transport* _transport;
    TransportHandle _handle;
    Step _step;
    unsigned long _startMs;
    unsigned long _timeoutMs;
    bool _timedOut;
    bool _greeted;
    char _rx[256];
    size_t _rxLen;
    PjlinkInfo _info;
};

} // namespace tvscout
