#ifndef CONSOLE_CONSENT_HPP
#define CONSOLE_CONSENT_HPP

#include "app/consent_gate.hpp"

#include <functional>
#include <ostream>
#include <string>

// Asks on the terminal before the microphone is opened for the first time.
// The next input line answers a pending request; a grant is remembered.
class ConsoleConsent : public ConsentGate {
public:
    using OnGranted = std::function<void()>;

    ConsoleConsent(std::ostream& out, bool remembered, OnGranted onGranted = {});

    bool granted() const override { return granted_; }
    void request(Callback onResult) override;

    bool awaitingAnswer() const { return static_cast<bool>(pending_); }

    // "y" or "yes", in any case, grants. Anything else denies.
    void answer(const std::string& line);

private:
    std::ostream& out_;
    bool granted_;
    OnGranted onGranted_;
    Callback pending_;
};

#endif
