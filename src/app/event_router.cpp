#include "app/event_router.hpp"

#include <cctype>
#include <exception>
#include <iostream>
#include <utility>

namespace {

std::string trimmed(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace

// Listener handed to one recognizer session. Runs on the recognizer's worker
// and forwards every event to the UI context tagged with its generation.
class RecognitionEventRouter::SessionEvents : public RecognitionListener {
public:
    SessionEvents(RecognitionEventRouter& router, uint64_t generation)
        : router_(&router), generation_(generation), dispatch_(router.dispatch_), alive_(router.alive_) {}

    void onPartialResult(const Hypothesis& hypothesis) override {
        forward(false, [hypothesis](RecognitionEventRouter& r) { r.onPartialResult(hypothesis); });
    }

    void onResult(const Hypothesis& hypothesis) override {
        forward(false, [hypothesis](RecognitionEventRouter& r) { r.onResult(hypothesis); });
    }

    void onFinalResult(const Hypothesis& hypothesis) override {
        forward(true, [hypothesis](RecognitionEventRouter& r) { r.onFinalResult(hypothesis); });
    }

    void onError(const std::string& message) override {
        forward(false, [message](RecognitionEventRouter& r) { r.onError(message); });
    }

    void onTimeout() override {
        forward(false, [](RecognitionEventRouter& r) { r.onTimeout(); });
    }

private:
    // Once the session has been released only the final hypothesis it
    // flushed on stop still counts; anything else it queued is stale.
    template <typename Fn>
    void forward(bool flushedOnStop, Fn fn) {
        RecognitionEventRouter* router = router_;
        const uint64_t generation = generation_;
        std::weak_ptr<Token> alive = alive_;

        dispatch_([router, generation, alive, flushedOnStop, fn]() {
            if (alive.expired()) return;
            if (router->generation_ != generation) return;
            if (router->releasedGeneration_ == generation && !flushedOnStop) return;
            fn(*router);
        });
    }

    RecognitionEventRouter* router_;
    uint64_t generation_;
    Dispatcher dispatch_;
    std::weak_ptr<Token> alive_;
};

// Constructor
RecognitionEventRouter::RecognitionEventRouter(StateContainer& state,
                                               RecognizerFactory& recognizers,
                                               ConsentGate& consent,
                                               const Clock& clock,
                                               Dispatcher dispatch,
                                               Policy policy)
    : state_(state),
      recognizers_(recognizers),
      consent_(consent),
      clock_(clock),
      dispatch_(std::move(dispatch)),
      policy_(std::move(policy)),
      alive_(std::make_shared<Token>()) {}

// Destructor. Never leaves a capture device open
RecognitionEventRouter::~RecognitionEventRouter() {
    alive_.reset();
    releaseSession();
}

void RecognitionEventRouter::onModelLoading() { state_.setLoading(); }

void RecognitionEventRouter::onModelReady(std::shared_ptr<SpeechModel> model) {
    model_ = std::move(model);
    std::cout << "[Event Router] Model ready" << std::endl;
    state_.setReady();
}

void RecognitionEventRouter::onModelFailed(const std::string& message) {
    std::cerr << "[Event Router] [ERROR] Model preparation failed: " << message << std::endl;
    state_.setError("Error: " + message);
}

// Record/stop control
void RecognitionEventRouter::toggleRecording() {
    if (session_) {
        stopRecording();
    } else {
        checkConsentAndStart();
    }
}

void RecognitionEventRouter::checkConsentAndStart() {
    if (consent_.granted()) {
        startRecording();
        return;
    }
    if (consentPending_) return;

    consentPending_ = true;
    std::weak_ptr<Token> alive = alive_;
    Dispatcher dispatch = dispatch_;
    consent_.request([this, alive, dispatch](bool granted) {
        dispatch([this, alive, granted]() {
            if (alive.expired()) return;
            onConsentResult(granted);
        });
    });
}

void RecognitionEventRouter::onConsentResult(bool granted) {
    consentPending_ = false;
    if (granted) {
        startRecording();
        return;
    }
    std::cout << "[Event Router] [WARN] Microphone permission denied" << std::endl;
    if (noticeSink_) noticeSink_("Permission denied! Cannot record audio.");
}

void RecognitionEventRouter::startRecording() {
    if (!model_) {
        state_.setError("Model is not ready.");
        return;
    }
    if (session_) return;

    transcript_.clear();
    lastPartialMs_.reset();
    ++generation_;

    events_ = std::make_unique<SessionEvents>(*this, generation_);
    try {
        session_ = recognizers_.start(*model_, *events_);
    } catch (const std::exception& e) {
        std::cerr << "[Event Router] [ERROR] Could not start recognizer: " << e.what() << std::endl;
        session_.reset();
        state_.setError(e.what());
        return;
    }

    std::cout << "[Event Router] Recording session " << generation_ << " started" << std::endl;
    state_.setRecording();
}

void RecognitionEventRouter::stopRecording() {
    releaseSession();
    state_.setReady();
}

void RecognitionEventRouter::onPartialResult(const Hypothesis& hypothesis) {
    const std::string partial = trimmed(hypothesis.text);
    if (partial.empty()) return;

    const int64_t now = clock_.nowMs();
    if (lastPartialMs_ && now - *lastPartialMs_ < policy_.throttleMs) return;
    lastPartialMs_ = now;

    display(transcript_ + policy_.separator + partial);
}

void RecognitionEventRouter::onResult(const Hypothesis& hypothesis) { acceptFinal(hypothesis); }

void RecognitionEventRouter::onFinalResult(const Hypothesis& hypothesis) { acceptFinal(hypothesis); }

void RecognitionEventRouter::acceptFinal(const Hypothesis& hypothesis) {
    const std::string text = trimmed(hypothesis.text);
    if (text.empty()) return;

    transcript_.append(text).append(policy_.separator);
    display(transcript_);

    if (policy_.stopOnFinalResult && session_) stopRecording();
}

// The session is abandoned before the error is shown
void RecognitionEventRouter::onError(const std::string& message) {
    std::cerr << "[Event Router] [ERROR] Recognition error: " << message << std::endl;
    releaseSession();
    state_.setError(message.empty() ? std::string("Unknown recognition error") : message);
}

void RecognitionEventRouter::onTimeout() {
    std::cout << "[Event Router] Recognizer timed out" << std::endl;
    stopRecording();
}

void RecognitionEventRouter::releaseSession() {
    if (!session_) return;
    releasedGeneration_ = generation_;
    // Detached first: stop() may deliver the final hypothesis re-entrantly.
    std::unique_ptr<RecognizerSession> session = std::move(session_);
    session->stop();
}

void RecognitionEventRouter::display(std::string text) {
    displayedText_ = std::move(text);
    if (textSink_) textSink_(displayedText_);
}
