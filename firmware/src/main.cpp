#include <ArduinoJson.h>
#include <cstdio>
#include <cstring>
#include "config.h"
#include "debug_log.h"
#include "platform/platform.h"
#include "util/text.h"
#include "network/socket_transport.h"
#include "discovery/orchestrator.h"
#include "devices/device_json.h"
#include "brand/brand_detector.h"

#ifdef ARDUINO
#include <Arduino.h>
#include "network/wifi_manager.h"
#endif

// Prints each merged device as one JSON line, brand annotated the way a
// storage layer would before saving it
class ConsoleListener : public tvscout::DiscoveryListener {
public:
    ConsoleListener() : devices(0), errors(0), finished(false),
                        reason(tvscout::FinishReason::COMPLETED) {}

    void onDevice(const tvscout::DiscoveredDevice& device, tvscout::MergeAction action) override {
        tvscout::DiscoveredDevice annotated = tvscout::annotateBrand(device);

        JsonDocument doc;
        if (!tvscout::deviceToJson(doc, annotated)) {
            LOG_ERROR("MAIN", "Failed to serialize %s", device.address);
            return;
        }
        doc["update"] = tvscout::mergeActionToString(action);
        doc["type"] = tvscout::deviceTypeToString(tvscout::deviceType(annotated));

        char line[1024];
        serializeJson(doc, line, sizeof(line));
#ifdef ARDUINO
        Serial.println(line);
#else
        printf("%s\n", line);
        fflush(stdout);
#endif
        devices++;
    }

    void onError(tvscout::DiscoveryMethod method, tvscout::DiscoveryError error,
                 const char* message) override {
        errors++;
#ifdef ARDUINO
        Serial.printf("error [%s/%s] %s\n", tvscout::discoveryMethodToString(method),
                      tvscout::discoveryErrorToString(error), message);
#else
        fprintf(stderr, "error [%s/%s] %s\n", tvscout::discoveryMethodToString(method),
                tvscout::discoveryErrorToString(error), message);
#endif
    }

    void onFinished(tvscout::FinishReason why) override {
        finished = true;
        reason = why;
        LOG_INFO("MAIN", "Discovery finished (%s), %d updates, %d errors",
                 tvscout::finishReasonToString(why), devices, errors);
    }

    int devices;
    int errors;
    bool finished;
    tvscout::FinishReason reason;
};

// Options shared by every mode; false when there is no usable interface
static bool baseOptions(tvscout::DiscoveryOptions& options) {
    tvscout::initOptions(options);
    options.timeoutMs = DISCOVERY_TIMEOUT_MS;
    tvscout::currentNetworkName(options.networkName, sizeof(options.networkName));
    return tvscout::localIpv4(options.localAddress, sizeof(options.localAddress));
}

#ifdef ARDUINO

tvscout::WifiManager wifi;
tvscout::SocketTransport transport;
tvscout::DiscoveryOrchestrator orchestrator(transport);
ConsoleListener listener;

unsigned long lastScanMs = 0;
bool scannedOnce = false;

char consoleLine[tvscout::CODE_PAYLOAD_LEN];

static void startNetworkScan(unsigned long now) {
    tvscout::DiscoveryOptions options;
    if (!baseOptions(options)) {
        LOG_ERROR("MAIN", "No local address, scan skipped");
        return;
    }
    transport.setInterfaceAddress(options.localAddress);
    orchestrator.start(tvscout::DiscoveryMode::NETWORK, options, now);
}

// Console commands: "scan", "ip <addr>", "stop", or a pasted code payload
static void handleConsoleLine(char* line, unsigned long now) {
    tvscout::DiscoveryOptions options;
    baseOptions(options);

    if (strcmp(line, "scan") == 0) {
        startNetworkScan(now);
    } else if (strcmp(line, "stop") == 0) {
        orchestrator.stop();
    } else if (tvscout::startsWith(line, "ip ")) {
        tvscout::copyTrimmed(options.targetAddress, sizeof(options.targetAddress), line + 3, strlen(line + 3));
        orchestrator.start(tvscout::DiscoveryMode::DIRECT_IP, options, now);
    } else if (line[0] == '{') {
        if (orchestrator.isRunning() && orchestrator.mode() == tvscout::DiscoveryMode::CODE_SCAN) {
            tvscout::SubmitResult result = orchestrator.submitCode(line);
            LOG_INFO("MAIN", "Code %s", tvscout::submitResultToString(result));
        } else {
            options.timeoutMs = 0;
            tvscout::copyString(options.codePayload, sizeof(options.codePayload), line);
            orchestrator.start(tvscout::DiscoveryMode::CODE_SCAN, options, now);
        }
    } else if (line[0] != '\0') {
        Serial.println("commands: scan | stop | ip <addr> | {code json}");
    }
}

static void readConsole(unsigned long now) {
    static size_t len = 0;
    while (Serial.available() > 0) {
        char c = (char)Serial.read();
        if (c == '\r') continue;
        if (c == '\n') {
            consoleLine[len] = '\0';
            len = 0;
            handleConsoleLine(consoleLine, now);
            continue;
        }
        if (len < sizeof(consoleLine) - 1) consoleLine[len++] = c;
    }
}

void setup() {
    Serial.begin(115200);
    delay(2000);

    Serial.println();
    Serial.println("============================");
    Serial.println("  TV Scout v" FIRMWARE_VERSION);
    Serial.println("============================");
    Serial.println();

    wifi.registerEvents();
    while (!wifi.connect()) {
        LOG_ERROR("MAIN", "WiFi failed, retrying in 5s...");
        delay(5000);
    }

    orchestrator.setListener(&listener);
    LOG_INFO("MAIN", "Boot complete. Free heap: %lu bytes", (unsigned long)ESP.getFreeHeap());
}

void loop() {
    unsigned long now = millis();

    wifi.checkAndReconnect();
    readConsole(now);

    if (!wifi.isConnected()) {
        if (orchestrator.isRunning()) orchestrator.stop();
        delay(10);
        return;
    }

    if (!orchestrator.isRunning() && (!scannedOnce || now - lastScanMs >= RESCAN_INTERVAL_MS)) {
        scannedOnce = true;
        lastScanMs = now;
        startNetworkScan(now);
    }

    orchestrator.poll(now);
    delay(2);
}

#else

static void usage(const char* argv0) {
    fprintf(stderr,
            "usage: %s [network | ip <address> | code <json|->]\n"
            "  network       sweep the local network (default)\n"
            "  ip <address>  identify one device\n"
            "  code <json>   decode a pairing code payload ('-' reads stdin)\n",
            argv0);
}

int main(int argc, char** argv) {
    const char* modeArg = argc > 1 ? argv[1] : "network";

    tvscout::DiscoveryMode mode;
    if (!tvscout::discoveryModeFromString(modeArg, mode)) {
        usage(argv[0]);
        return 2;
    }

    tvscout::DiscoveryOptions options;
    bool haveAddress = baseOptions(options);

    switch (mode) {
        case tvscout::DiscoveryMode::NETWORK:
            if (!haveAddress) {
                fprintf(stderr, "no IPv4 interface is up\n");
                return 1;
            }
            break;
        case tvscout::DiscoveryMode::DIRECT_IP:
            if (argc < 3) {
                usage(argv[0]);
                return 2;
            }
            tvscout::copyString(options.targetAddress, sizeof(options.targetAddress), argv[2]);
            break;
        case tvscout::DiscoveryMode::CODE_SCAN:
            if (argc < 3) {
                usage(argv[0]);
                return 2;
            }
            if (strcmp(argv[2], "-") == 0) {
                if (fgets(options.codePayload, sizeof(options.codePayload), stdin) == nullptr) {
                    fprintf(stderr, "no code payload on stdin\n");
                    return 2;
                }
            } else {
                tvscout::copyString(options.codePayload, sizeof(options.codePayload), argv[2]);
            }
            break;
    }

    static tvscout::SocketTransport transport;
    if (haveAddress) transport.setInterfaceAddress(options.localAddress);

    static tvscout::DiscoveryOrchestrator orchestrator(transport);
    ConsoleListener listener;
    orchestrator.setListener(&listener);

    orchestrator.start(mode, options, tvscout::monotonicMs());
    while (orchestrator.isRunning()) {
        orchestrator.poll(tvscout::monotonicMs());
        tvscout::idleMs(2);
    }
    transport.closeAll();

    if (listener.devices > 0) return 0;
    return listener.errors > 0 ? 1 : 3;
}

#endif
