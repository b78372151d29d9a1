#ifndef WHISPERNOTES_TESTS_FAKES_HPP
#define WHISPERNOTES_TESTS_FAKES_HPP

#include <app/clock.hpp>
#include <app/consent_gate.hpp>
#include <stt/recognition.hpp>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fakes {

struct ManualClock : Clock {
    int64_t now = 0;
    int64_t nowMs() const override { return now; }
};

struct FakeModel : SpeechModel {
    std::string reply = "hello";
    std::string transcribe(const std::vector<float>&) override { return reply; }
};

struct FakeConsent : ConsentGate {
    bool isGranted = true;
    int requests = 0;
    Callback pending;

    bool granted() const override { return isGranted; }
    void request(Callback onResult) override {
        ++requests;
        pending = std::move(onResult);
    }

    void answer(bool grant) {
        Callback cb = std::move(pending);
        pending = nullptr;
        if (cb) cb(grant);
    }
};

struct SessionStats {
    int stops = 0;
    bool released = false;
};

struct FakeSession : RecognizerSession {
    RecognitionListener& listener;
    std::shared_ptr<SessionStats> stats;
    std::string finalOnStop;
    bool stopped = false;

    FakeSession(RecognitionListener& l, std::shared_ptr<SessionStats> s, std::string finalText)
        : listener(l), stats(std::move(s)), finalOnStop(std::move(finalText)) {}

    ~FakeSession() override { stats->released = true; }

    void stop() override {
        ++stats->stops;
        if (stopped) return;
        stopped = true;
        if (!finalOnStop.empty()) listener.onFinalResult(Hypothesis{finalOnStop});
    }
};

struct FakeRecognizerFactory : RecognizerFactory {
    std::string throwOnStart;
    std::string finalOnStop;
    int starts = 0;
    RecognitionListener* listener = nullptr;
    std::vector<std::shared_ptr<SessionStats>> sessions;

    std::unique_ptr<RecognizerSession> start(SpeechModel&, RecognitionListener& l) override {
        if (!throwOnStart.empty()) throw std::runtime_error(throwOnStart);
        ++starts;
        listener = &l;
        sessions.push_back(std::make_shared<SessionStats>());
        return std::make_unique<FakeSession>(l, sessions.back(), finalOnStop);
    }

    std::shared_ptr<SessionStats> last() const { return sessions.empty() ? nullptr : sessions.back(); }
};

// Runs posted work straight away, as if the caller were already on the UI thread.
inline std::function<void(std::function<void()>)> immediate() {
    return [](std::function<void()> task) { task(); };
}

} // namespace fakes

#endif
