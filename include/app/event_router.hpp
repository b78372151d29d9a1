#ifndef EVENT_ROUTER_HPP
#define EVENT_ROUTER_HPP

#include "app/clock.hpp"
#include "app/consent_gate.hpp"
#include "app/state_container.hpp"
#include "stt/recognition.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

// Turns user toggles, model-loading outcomes and recognizer events into
// StateContainer transitions, and keeps the running transcript.
//
// Every public method must run on the UI context. Recognizer events reach it
// through the dispatcher, tagged with the session they came from; events of
// an older session are dropped, and so is everything a stopped session queued
// except the final hypothesis it flushed.
class RecognitionEventRouter {
public:
    struct Policy {
        int throttleMs = 2000;
        // End the session after each finalized hypothesis instead of
        // capturing continuously.
        bool stopOnFinalResult = false;
        std::string separator = " ";
    };

    // Schedules a task on the UI context.
    using Dispatcher = std::function<void(std::function<void()>)>;
    using TextSink = std::function<void(const std::string& text)>;

    RecognitionEventRouter(StateContainer& state,
                           RecognizerFactory& recognizers,
                           ConsentGate& consent,
                           const Clock& clock,
                           Dispatcher dispatch,
                           Policy policy);
    ~RecognitionEventRouter();

    RecognitionEventRouter(const RecognitionEventRouter&) = delete;
    RecognitionEventRouter& operator=(const RecognitionEventRouter&) = delete;

    void setTextSink(TextSink sink) { textSink_ = std::move(sink); }
    void setNoticeSink(TextSink sink) { noticeSink_ = std::move(sink); }

    void onModelLoading();
    void onModelReady(std::shared_ptr<SpeechModel> model);
    void onModelFailed(const std::string& message);

    void toggleRecording();
    void startRecording();
    void stopRecording();
    void onConsentResult(bool granted);

    void onPartialResult(const Hypothesis& hypothesis);
    void onResult(const Hypothesis& hypothesis);
    void onFinalResult(const Hypothesis& hypothesis);
    void onError(const std::string& message);
    void onTimeout();

    bool isRecording() const { return session_ != nullptr; }
    bool modelReady() const { return model_ != nullptr; }
    bool consentPending() const { return consentPending_; }

    const std::string& transcript() const { return transcript_; }
    const std::string& displayedText() const { return displayedText_; }

private:
    class SessionEvents;
    struct Token {};

    void checkConsentAndStart();
    void acceptFinal(const Hypothesis& hypothesis);
    void releaseSession();
    void display(std::string text);

    StateContainer& state_;
    RecognizerFactory& recognizers_;
    ConsentGate& consent_;
    const Clock& clock_;
    Dispatcher dispatch_;
    Policy policy_;

    TextSink textSink_;
    TextSink noticeSink_;

    std::shared_ptr<SpeechModel> model_;

    std::string transcript_;
    std::string displayedText_;
    std::optional<int64_t> lastPartialMs_;

    bool consentPending_ = false;
    uint64_t generation_ = 0;
    uint64_t releasedGeneration_ = 0;

    // Posted tasks hold a weak reference so they become no-ops after teardown.
    std::shared_ptr<Token> alive_;

    // events_ is declared before session_ so the session is destroyed first.
    std::unique_ptr<SessionEvents> events_;
    std::unique_ptr<RecognizerSession> session_;
};

#endif
