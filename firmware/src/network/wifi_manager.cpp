#ifdef ARDUINO
#include "wifi_manager.h"
#include "../config.h"
#include "../debug_log.h"

namespace tvscout {

const char* wifiStateToString(WifiState state) {
    switch (state) {
        case WifiState::DISCONNECTED: return "disconnected";
        case WifiState::CONNECTING:   return "connecting";
        case WifiState::CONNECTED:    return "connected";
        default:                      return "unknown";
    }
}

// ESP32 Wi-Fi events are plain C callbacks
static WifiManager* _instance = nullptr;

static void wifiEventHandler(WiFiEvent_t event) {
    if (!_instance) return;
    switch (event) {
        case ARDUINO_EVENT_WIFI_STA_DISCONNECTED:
            _instance->onDisconnected();
            break;
        case ARDUINO_EVENT_WIFI_STA_GOT_IP:
            _instance->onConnected();
            break;
        default:
            break;
    }
}

WifiManager::WifiManager()
    : _backoff(WIFI_BACKOFF), _state(WifiState::DISCONNECTED), _reconnects(0) {}

void WifiManager::registerEvents() {
    _instance = this;
    WiFi.onEvent(wifiEventHandler);
}

void WifiManager::onDisconnected() {
    if (_state == WifiState::DISCONNECTED) return;
    _state = WifiState::DISCONNECTED;
    LOG_ERROR("WIFI", "Disconnected (reconnects=%d)", _reconnects);
}

void WifiManager::onConnected() {
    _state = WifiState::CONNECTED;
    _backoff.reset();
    LOG_INFO("WIFI", "Connected ip=%s rssi=%d", WiFi.localIP().toString().c_str(), WiFi.RSSI());
}

bool WifiManager::connect() {
    LOG_INFO("WIFI", "Connecting to %s...", WIFI_SSID);

    _state = WifiState::CONNECTING;
    WiFi.mode(WIFI_STA);
    WiFi.begin(WIFI_SSID, WIFI_PASSWORD);

    int attempts = 0;
    while (WiFi.status() != WL_CONNECTED && attempts < 20) {
        delay(500);
        attempts++;
    }

    if (WiFi.status() == WL_CONNECTED) {
        onConnected();
        return true;
    }

    _state = WifiState::DISCONNECTED;
    _backoff.fail(millis());
    LOG_ERROR("WIFI", "Failed to connect after %d attempts", attempts);
    return false;
}

bool WifiManager::isConnected() {
    return WiFi.status() == WL_CONNECTED;
}

void WifiManager::checkAndReconnect() {
    if (WiFi.status() == WL_CONNECTED) {
        if (_state != WifiState::CONNECTED) onConnected();
        return;
    }

    unsigned long now = millis();
    if (!_backoff.ready(now)) return;

    _reconnects++;
    _state = WifiState::CONNECTING;
    LOG_INFO("WIFI", "Reconnect attempt %d (next wait %lums)...", _reconnects,
             backoffNext(_backoff.intervalMs(), WIFI_BACKOFF));

    WiFi.disconnect();
    WiFi.begin(WIFI_SSID, WIFI_PASSWORD);

    // Completion arrives through the GOT_IP event
    _backoff.fail(now);
}

} // namespace tvscout
#endif
