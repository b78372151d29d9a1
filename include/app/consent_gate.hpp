#ifndef CONSENT_GATE_HPP
#define CONSENT_GATE_HPP

#include <functional>

// Microphone capture permission. request() answers asynchronously, possibly
// from another thread, and may never answer if the UI goes away first.
class ConsentGate {
public:
    using Callback = std::function<void(bool granted)>;

    virtual ~ConsentGate() = default;

    virtual bool granted() const = 0;
    virtual void request(Callback onResult) = 0;
};

#endif
