#pragma once

// Credentials come from build flags; these are fallbacks
#ifndef WIFI_SSID
#define WIFI_SSID          "not-configured"
#endif
#ifndef WIFI_PASSWORD
#define WIFI_PASSWORD      "not-configured"
#endif

// Scanner identity
#define TVSCOUT_NAME       "tvscout"
#define FIRMWARE_VERSION   "1.0.0"
#define USER_AGENT         "TvScout/1.0"

// Board runner: seconds between network sweeps
#ifndef RESCAN_INTERVAL_MS
#define RESCAN_INTERVAL_MS 60000
#endif

// Whole-session budget shared by the orchestrator and every prober
#ifndef DISCOVERY_TIMEOUT_MS
#define DISCOVERY_TIMEOUT_MS   15000
#endif

// SSDP (UPnP) search
#define SSDP_SEARCH_INTERVAL_MS  2000
#define SSDP_HTTP_TIMEOUT_MS     2000
#define SSDP_FETCH_SLOTS         4

// mDNS
#define MDNS_ADDRESS             "224.0.0.251"
#define MDNS_PORT                5353
#define MDNS_SERVICE_WINDOW_MS   1500
#define MDNS_FOLLOWUP_MS         250
#define MDNS_MAX_INSTANCES       12
#define MDNS_MAX_HOSTS           12

// Port sweep over the local /24
#define PROBE_CONNECT_TIMEOUT_MS 300
#define PROBE_HTTP_TIMEOUT_MS    2000
#define PROBE_BATCH_SIZE         25
#define PROBE_BATCH_DELAY_MS     50
#define PROBE_START_DELAY_MS     200
#define PROBE_RESOLVER_SLOTS     4

// Direct-IP resolution
#define DIRECT_IP_HTTP_TIMEOUT_MS    3000
#define DIRECT_IP_CONNECT_TIMEOUT_MS 500
#define PJLINK_PORT                  4352
#define PJLINK_TIMEOUT_MS            2000

// Capacities (RAM is tight on the board, roomy on the host)
#ifdef ARDUINO
#define MAX_TRACKED_DEVICES      32
#define TRANSPORT_MAX_SOCKETS    12
#define HTTP_BUFFER_SIZE         4096
#else
#define MAX_TRACKED_DEVICES      128
#define TRANSPORT_MAX_SOCKETS    96
#define HTTP_BUFFER_SIZE         8192
#endif

// Debug levels (compile-time)
#define DEBUG_LEVEL_NONE   0
#define DEBUG_LEVEL_ERROR  1
#define DEBUG_LEVEL_INFO   2
#define DEBUG_LEVEL_DEBUG  3
#define DEBUG_LEVEL_TRACE  4

#ifndef DEBUG_LEVEL
#define DEBUG_LEVEL        DEBUG_LEVEL_INFO
#endif
