#include "endpoint_resolver.h"
#include "../debug_log.h"
#include "../protocols/xml_fields.h"
#include "../util/text.h"
#include <ArduinoJson.h>
#include <cstdio>
#include <cstring>

namespace tvscout {

static const char* JOINTSPACE_PATHS[] = {"/1/system", "/5/system", "/6/system"};
static const int NUM_JOINTSPACE_PATHS = 3;

static const char* GENERIC_HTTP_PATHS[] = {
    "/description.xml", "/ssdp/device-desc.xml", "/upnp/desc.xml"
};
static const int NUM_GENERIC_HTTP_PATHS = 3;

// Port -> description document path; anything else uses /description.xml
struct DescriptionPath {
    uint16_t port;
    const char* path;
};

static const DescriptionPath DESCRIPTION_PATHS[] = {
    {8008, "/ssdp/device-desc.xml"},
    {1400, "/xml/device_description.xml"},
    {9197, "/dmr"}
};
static const int NUM_DESCRIPTION_PATHS = 3;

ResolverKind resolverForPort(uint16_t port) {
    switch (port) {
        case 1925:
        case 1926:
            return ResolverKind::JOINTSPACE;
        case 8008:
            return ResolverKind::DIAL;
        case 80:
        case 8080:
        case 49152:
        case 49153:
            return ResolverKind::GENERIC_HTTP;
        default:
            return ResolverKind::NONE;
    }
}

const char* resolverKindToString(ResolverKind kind) {
    switch (kind) {
        case ResolverKind::NONE:             return "none";
        case ResolverKind::JOINTSPACE:       return "jointspace";
        case ResolverKind::DIAL:             return "dial";
        case ResolverKind::GENERIC_HTTP:     return "generic_http";
        case ResolverKind::UPNP_DESCRIPTION: return "upnp_description";
        default:                             return "unknown";
    }
}

const char* upnpDescriptionPath(uint16_t port) {
    for (int i = 0; i < NUM_DESCRIPTION_PATHS; i++) {
        if (DESCRIPTION_PATHS[i].port == port) return DESCRIPTION_PATHS[i].path;
    }
    return "/description.xml";
}

const char* serviceTypeForPort(uint16_t port) {
    switch (port) {
        case 1925:
        case 1926:
            return "JointSpace TV";
        case 8008:
            return "DIAL TV";
        case 8080:
            return "HTTP TV";
        default:
            return "Unknown Device";
    }
}

bool resolverEndpoint(ResolverKind kind, const char* ip, uint16_t port, int step,
                      char* url, size_t urlLen) {
    const char* scheme = "http";
    const char* path = nullptr;

    switch (kind) {
        case ResolverKind::JOINTSPACE:
            if (step < 0 || step >= NUM_JOINTSPACE_PATHS) return false;
            if (port == 1926) scheme = "https";
            path = JOINTSPACE_PATHS[step];
            break;
        case ResolverKind::DIAL:
            if (step != 0) return false;
            path = "/ssdp/device-desc.xml";
            break;
        case ResolverKind::GENERIC_HTTP:
            if (step < 0 || step >= NUM_GENERIC_HTTP_PATHS) return false;
            path = GENERIC_HTTP_PATHS[step];
            break;
        case ResolverKind::UPNP_DESCRIPTION:
            if (step != 0) return false;
            path = upnpDescriptionPath(port);
            break;
        default:
            return false;
    }

    int n = snprintf(url, urlLen, "%s://%s:%u%s", scheme, ip, port, path);
    return n > 0 && (size_t)n < urlLen;
}

bool parseJointSpaceSystem(const char* json, DiscoveredDevice& device) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) return false;

    JsonObjectConst obj = doc.as<JsonObjectConst>();
    if (obj.isNull()) return false;

    const char* name = "Philips TV";
    if (obj["name"].is<const char*>()) {
        name = obj["name"].as<const char*>();
    } else if (obj["model"].is<const char*>()) {
        name = obj["model"].as<const char*>();
    }

    setField(device.displayName, sizeof(device.displayName), name);
    setField(device.manufacturer, sizeof(device.manufacturer), "Philips");
    if (obj["model"].is<const char*>()) {
        setField(device.modelName, sizeof(device.modelName), obj["model"].as<const char*>());
    }
    setField(device.serviceType, sizeof(device.serviceType), "JointSpace TV");
    return true;
}

bool resolveFromBody(ResolverKind kind, const char* url, const char* body,
                     DiscoveredDevice& device) {
    if (kind == ResolverKind::JOINTSPACE) {
        return parseJointSpaceSystem(body, device);
    }

    DeviceDescription info;
    if (!parseDeviceDescription(body, info)) return false;

    switch (kind) {
        case ResolverKind::DIAL:
        case ResolverKind::GENERIC_HTTP:
            // Probed ports answer many things; only a named device counts
            if (info.friendlyName[0] == '\0') return false;
            setField(device.displayName, sizeof(device.displayName), info.friendlyName);
            setField(device.manufacturer, sizeof(device.manufacturer), info.manufacturer);
            setField(device.serviceType, sizeof(device.serviceType),
                     kind == ResolverKind::DIAL ? "DIAL TV" : "HTTP TV");
            break;
        case ResolverKind::UPNP_DESCRIPTION:
            setField(device.displayName, sizeof(device.displayName),
                     info.friendlyName[0] ? info.friendlyName : "Smart Device");
            setField(device.manufacturer, sizeof(device.manufacturer), info.manufacturer);
            setField(device.modelName, sizeof(device.modelName), info.modelName);
            shortServiceType(info.deviceType, device.serviceType, sizeof(device.serviceType));
            break;
        default:
            return false;
    }

    setField(device.location, sizeof(device.location), url);
    return true;
}

EndpointResolver::EndpointResolver()
    : _kind(ResolverKind::NONE), _step(0), _port(0),
      _method(DiscoveryMethod::PORT_PROBE), _requestTimeoutMs(0),
      _busy(false), _sawTimeout(false) {
    _ip[0] = '\0';
    initDevice(_device);
}

EndpointResolver::EndpointResolver(Transport& transport)
    : _fetch(transport), _kind(ResolverKind::NONE), _step(0), _port(0),
      _method(DiscoveryMethod::PORT_PROBE), _requestTimeoutMs(0),
      _busy(false), _sawTimeout(false) {
    _ip[0] = '\0';
    initDevice(_device);
}

bool EndpointResolver::begin(ResolverKind kind, const char* ip, uint16_t port,
                             DiscoveryMethod method, unsigned long requestTimeoutMs,
                             unsigned long nowMs) {
    cancel();

    if (kind == ResolverKind::NONE) return false;

    _kind = kind;
    _step = 0;
    copyString(_ip, sizeof(_ip), ip);
    _port = port;
    _method = method;
    _requestTimeoutMs = requestTimeoutMs;
    _sawTimeout = false;
    initDevice(_device);

    _busy = startStep(nowMs);
    return _busy;
}

bool EndpointResolver::startStep(unsigned long nowMs) {
    char url[128];
    while (resolverEndpoint(_kind, _ip, _port, _step, url, sizeof(url))) {
        if (_fetch.begin(url, _requestTimeoutMs, nowMs)) return true;
        _step++;
    }
    return false;
}

FetchResult EndpointResolver::poll(unsigned long nowMs) {
    if (!_busy) return FetchResult::FAILED;

    FetchResult r = _fetch.poll(nowMs);
    if (r == FetchResult::PENDING) return FetchResult::PENDING;

    if (r == FetchResult::DONE && _fetch.status() == 200) {
        DiscoveredDevice found;
        initDevice(found);
        if (resolveFromBody(_kind, _fetch.url(), _fetch.body(), found)) {
            setField(found.address, sizeof(found.address), _ip);
            found.port = _port;
            found.method = _method;
            _device = found;
            _busy = false;
            LOG_DEBUG("RESOLVE", "%s:%u identified as \"%s\"", _ip, _port, _device.displayName);
            return FetchResult::DONE;
        }
        LOG_TRACE("RESOLVE", "%s: unusable body", _fetch.url());
    }

    if (_fetch.timedOut()) _sawTimeout = true;

    _step++;
    if (!startStep(nowMs)) {
        _busy = false;
        return FetchResult::FAILED;
    }
    return FetchResult::PENDING;
}

void EndpointResolver::cancel() {
    _fetch.cancel();
    _busy = false;
}

} // namespace tvscout
