#pragma once
#ifdef ARDUINO
#include <WiFi.h>
#include "backoff.h"

namespace tvscout {

enum class WifiState : uint8_t {
    DISCONNECTED = 0,
    CONNECTING   = 1,
    CONNECTED    = 2
};

const char* wifiStateToString(WifiState state);

// Station-mode link for the board runner. Discovery only starts while
// the link is up.
class WifiManager {
public:
    WifiManager();

    bool connect();            // blocks up to ~10s
    bool isConnected();
    void checkAndReconnect();  // non-blocking, call from loop()

    WifiState state() const { return _state; }
    int reconnectCount() const { return _reconnects; }

    void registerEvents();
    void onDisconnected();
    void onConnected();

private:
    Backoff _backoff;
    WifiState _state;
    int _reconnects;
};

} // namespace tvscout
#endif
