#ifndef WHISPER_SESSION_HPP
#define WHISPER_SESSION_HPP

#include "audio/audio_source.hpp"
#include "audio/speech_segmenter.hpp"
#include "stt/recognition.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Live recognition from an audio source. Audio is segmented into utterances;
// while one is in progress it is re-transcribed every partialIntervalMs and
// reported as a partial, and once it completes it is reported as a result.
//
// Capture and transcription run on separate threads so a slow model never
// stalls reading from the device. Listener calls come from the transcription
// thread, in capture order.
class WhisperSpeechSession : public RecognizerSession {
public:
    struct Config {
        SpeechSegmenter::Config audio;
        int partialIntervalMs = 1000;
        // No speech for this long ends the session with onTimeout(). 0 waits forever.
        int silenceTimeoutMs = 0;
    };

    WhisperSpeechSession(SpeechModel& model, RecognitionListener& listener, Config config,
                         std::unique_ptr<AudioSource> source);
    ~WhisperSpeechSession() override;

    WhisperSpeechSession(const WhisperSpeechSession&) = delete;
    WhisperSpeechSession& operator=(const WhisperSpeechSession&) = delete;

    void stop() override;

private:
    struct Job {
        enum class Kind {
            Partial,
            Result,
            Final,
            Timeout,
            Error
        };

        Kind kind = Kind::Final;
        std::vector<float> audio;
        std::string message;
    };

    void capture();
    void transcribe();
    void enqueue(Job job);
    void finishCapture();
    void deliver(const Job& job);

    SpeechModel& model_;
    RecognitionListener& listener_;
    Config config_;
    SpeechSegmenter segmenter_;
    std::unique_ptr<AudioSource> source_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool captureDone_ = false;

    std::atomic<bool> running_{false};
    std::thread captureThread_;
    std::thread transcribeThread_;
};

// Opens the default microphone for every session; throws std::runtime_error
// if it can't.
class WhisperSessionFactory : public RecognizerFactory {
public:
    explicit WhisperSessionFactory(WhisperSpeechSession::Config config) : config_(config) {}

    std::unique_ptr<RecognizerSession> start(SpeechModel& model, RecognitionListener& listener) override;

private:
    WhisperSpeechSession::Config config_;
};

#endif
