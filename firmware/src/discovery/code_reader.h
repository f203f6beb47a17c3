#pragma once
#include "discoverer.h"
#include "../protocols/code_payload.h"

namespace tvscout {

enum class SubmitResult : uint8_t {
    INACTIVE = 0,  // no session running
    IGNORED  = 1,  // not one of our codes, keep scanning
    REJECTED = 2,  // our code but invalid; session ended with an error
    ACCEPTED = 3   // device emitted; session ended
};

const char* submitResultToString(SubmitResult result);

// Turns captured code text into exactly one device or one validation
// error. Text that is not a JSON object is ignored so a camera can keep
// feeding frames until a real code shows up.
class CodeReader : public Discoverer {
public:
    CodeReader();

    DiscoveryMethod method() const override { return DiscoveryMethod::CODE_SCAN; }

    SubmitResult submit(const char* raw);

protected:
    bool onStart(const DiscoveryOptions& options, unsigned long nowMs) override;
    void onPoll(unsigned long nowMs) override;
    void cleanup() override;

private:
    char _pending[CODE_PAYLOAD_LEN];  // payload supplied with the options
};

} // namespace tvscout
