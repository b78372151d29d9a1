#ifndef RECOGNITION_HPP
#define RECOGNITION_HPP

#include <memory>
#include <string>
#include <vector>

// A recognizer guess at spoken content. Whether it may still change is told by
// the listener callback it arrives through.
struct Hypothesis {
    std::string text;
};

// Anything that can turn 16 kHz mono float PCM into text.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;
    virtual std::string transcribe(const std::vector<float>& pcm16kMono) = 0;
};

// Receives recognizer events. Implementations must expect calls from the
// recognizer's own worker thread.
class RecognitionListener {
public:
    virtual ~RecognitionListener() = default;

    virtual void onPartialResult(const Hypothesis& hypothesis) = 0;
    // An utterance completed while the session keeps listening.
    virtual void onResult(const Hypothesis& hypothesis) = 0;
    // The last hypothesis of a session, delivered when it stops.
    virtual void onFinalResult(const Hypothesis& hypothesis) = 0;
    virtual void onError(const std::string& message) = 0;
    virtual void onTimeout() = 0;
};

// One continuous recognizer activation. Destroying it must release the
// capture device.
class RecognizerSession {
public:
    virtual ~RecognizerSession() = default;

    // Stops capture and flushes the final hypothesis. Safe to call repeatedly.
    virtual void stop() = 0;
};

// Creates sessions. Throws std::runtime_error when the audio or recognizer
// resource cannot be acquired. The listener must outlive the session.
class RecognizerFactory {
public:
    virtual ~RecognizerFactory() = default;

    virtual std::unique_ptr<RecognizerSession> start(SpeechModel& model, RecognitionListener& listener) = 0;
};

#endif
