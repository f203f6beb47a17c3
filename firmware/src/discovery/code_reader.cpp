#include "code_reader.h"
#include "../debug_log.h"
#include "../util/text.h"

namespace tvscout {

const char* submitResultToString(SubmitResult result) {
    switch (result) {
        case SubmitResult::INACTIVE: return "inactive";
        case SubmitResult::IGNORED:  return "ignored";
        case SubmitResult::REJECTED: return "rejected";
        case SubmitResult::ACCEPTED: return "accepted";
        default:                     return "unknown";
    }
}

CodeReader::CodeReader() {
    _pending[0] = '\0';
}

bool CodeReader::onStart(const DiscoveryOptions& options, unsigned long nowMs) {
    (void)nowMs;
    copyString(_pending, sizeof(_pending), options.codePayload);
    LOG_INFO("CODE", "Waiting for a code");
    return true;
}

void CodeReader::onPoll(unsigned long nowMs) {
    (void)nowMs;
    if (_pending[0] == '\0') return;

    char raw[CODE_PAYLOAD_LEN];
    copyString(raw, sizeof(raw), _pending);
    _pending[0] = '\0';
    submit(raw);
}

SubmitResult CodeReader::submit(const char* raw) {
    if (!isActive()) return SubmitResult::INACTIVE;

    CodePayload payload;
    CodePayloadError err = parseCodePayload(raw, payload);

    if (err == CodePayloadError::NOT_JSON) {
        LOG_DEBUG("CODE", "Not a device code, still scanning");
        return SubmitResult::IGNORED;
    }

    if (err != CodePayloadError::NONE) {
        LOG_ERROR("CODE", "Rejected code: %s", codePayloadErrorToString(err));
        emitError(DiscoveryError::VALIDATION, "Invalid device code: %s",
                  codePayloadErrorToString(err));
        stop();
        return SubmitResult::REJECTED;
    }

    DiscoveredDevice device;
    codePayloadToDevice(payload, device);
    LOG_INFO("CODE", "Code for \"%s\" at %s:%u", payload.name, payload.ip, payload.port);
    emit(device);
    stop();
    return SubmitResult::ACCEPTED;
}

void CodeReader::cleanup() {
    _pending[0] = '\0';
}

} // namespace tvscout
