#include "platform.h"
#include "../util/text.h"
#include <cstdio>
#include <cstring>
#include <cstdlib>

#ifdef ARDUINO
#include <Arduino.h>
#include <WiFi.h>
#else
#include <chrono>
#include <thread>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <net/if.h>
#endif

namespace tvscout {

bool parseArpTable(const char* table, const char* ip, char* mac, size_t macLen) {
    if (table == nullptr || ip == nullptr || mac == nullptr || macLen == 0) return false;

    const char* line = table;
    while (*line) {
        const char* eol = strchr(line, '\n');
        size_t len = eol ? (size_t)(eol - line) : strlen(line);

        char row[160];
        size_t copyLen = len < sizeof(row) - 1 ? len : sizeof(row) - 1;
        memcpy(row, line, copyLen);
        row[copyLen] = '\0';

        // IP address  HW type  Flags  HW address  Mask  Device
        char rowIp[48], hwType[16], flags[16], hwAddr[32];
        if (sscanf(row, "%47s %15s %15s %31s", rowIp, hwType, flags, hwAddr) == 4 &&
            strcmp(rowIp, ip) == 0 &&
            strcmp(flags, "0x0") != 0 &&
            strcmp(hwAddr, "00:00:00:00:00:00") != 0) {
            return copyString(mac, macLen, hwAddr);
        }

        if (!eol) break;
        line = eol + 1;
    }
    return false;
}

#ifdef ARDUINO

unsigned long monotonicMs() {
    return millis();
}

bool localIpv4(char* out, size_t outLen) {
    if (WiFi.status() != WL_CONNECTED) return false;
    return copyString(out, outLen, WiFi.localIP().toString().c_str());
}

bool currentNetworkName(char* out, size_t outLen) {
    if (WiFi.status() != WL_CONNECTED) {
        copyString(out, outLen, "");
        return false;
    }
    return copyString(out, outLen, WiFi.SSID().c_str());
}

// lwIP keeps its ARP table private to the stack
NeighborLookup platformNeighborLookup() {
    return nullptr;
}

void idleMs(unsigned long ms) {
    delay(ms);
}

#else

unsigned long monotonicMs() {
    using namespace std::chrono;
    static const steady_clock::time_point origin = steady_clock::now();
    return (unsigned long)duration_cast<milliseconds>(steady_clock::now() - origin).count();
}

static bool isWirelessName(const char* name) {
    return containsNoCase(name, "wlan") || containsNoCase(name, "wifi") ||
           containsNoCase(name, "wlp") || startsWith(name, "en");
}

bool localIpv4(char* out, size_t outLen) {
    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) return false;

    char fallback[INET_ADDRSTRLEN] = "";
    char preferred[INET_ADDRSTRLEN] = "";

    for (struct ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0) continue;

        char addr[INET_ADDRSTRLEN];
        const struct sockaddr_in* sin = (const struct sockaddr_in*)ifa->ifa_addr;
        if (inet_ntop(AF_INET, &sin->sin_addr, addr, sizeof(addr)) == nullptr) continue;

        // Skip link-local 169.254.x.x
        if (startsWith(addr, "169.254.")) continue;

        if (preferred[0] == '\0' && isWirelessName(ifa->ifa_name)) {
            copyString(preferred, sizeof(preferred), addr);
        }
        if (fallback[0] == '\0') {
            copyString(fallback, sizeof(fallback), addr);
        }
    }
    freeifaddrs(list);

    const char* chosen = preferred[0] ? preferred : fallback;
    if (chosen[0] == '\0') return false;
    return copyString(out, outLen, chosen);
}

bool currentNetworkName(char* out, size_t outLen) {
    const char* env = getenv("TVSCOUT_SSID");
    copyString(out, outLen, env ? env : "");
    return env != nullptr;
}

#ifdef __linux__
static bool readProcNetArp(const char* ip, char* mac, size_t macLen) {
    FILE* f = fopen("/proc/net/arp", "r");
    if (f == nullptr) return false;

    char table[4096];
    size_t n = fread(table, 1, sizeof(table) - 1, f);
    fclose(f);
    table[n] = '\0';

    return parseArpTable(table, ip, mac, macLen);
}

NeighborLookup platformNeighborLookup() {
    return readProcNetArp;
}
#else
NeighborLookup platformNeighborLookup() {
    return nullptr;
}
#endif

void idleMs(unsigned long ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

#endif

} // namespace tvscout
