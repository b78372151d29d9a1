#include "stt/whisper_session.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

// Constructor
WhisperSpeechSession::WhisperSpeechSession(SpeechModel& model, RecognitionListener& listener, Config config,
                                           std::unique_ptr<AudioSource> source)
    : model_(model), listener_(listener), config_(config), segmenter_(config.audio), source_(std::move(source)) {
    if (!source_) throw std::invalid_argument("WhisperSpeechSession needs an audio source");

    running_.store(true);
    transcribeThread_ = std::thread(&WhisperSpeechSession::transcribe, this);
    captureThread_ = std::thread(&WhisperSpeechSession::capture, this);
}

// Destructor
WhisperSpeechSession::~WhisperSpeechSession() { stop(); }

// Stops capture, waits for every queued hypothesis and the final one to be
// delivered, then closes the device
void WhisperSpeechSession::stop() {
    running_.store(false);
    if (captureThread_.joinable()) captureThread_.join();
    if (transcribeThread_.joinable()) transcribeThread_.join();
    source_.reset();
}

// Capture thread: read and segment only
void WhisperSpeechSession::capture() {
    const int framesPerBuffer = config_.audio.framesPerBuffer;
    const int msPerBuffer = (int)std::lround(1000.0 * framesPerBuffer / config_.audio.sampleRate);

    std::vector<int16_t> buff(framesPerBuffer);
    int sincePartialMs = 0;

    try {
        while (running_.load()) {
            source_->read(buff.data(), framesPerBuffer);

            const SpeechSegmenter::Event event = segmenter_.feed(buff.data(), framesPerBuffer);

            if (event == SpeechSegmenter::Event::UtteranceComplete) {
                enqueue(Job{Job::Kind::Result, segmenter_.utterance(), {}});
                segmenter_.nextUtterance();
                sincePartialMs = 0;
                continue;
            }

            if (segmenter_.inSpeech()) {
                sincePartialMs += msPerBuffer;
                if (sincePartialMs >= config_.partialIntervalMs) {
                    sincePartialMs = 0;
                    enqueue(Job{Job::Kind::Partial, segmenter_.utterance(), {}});
                }
                continue;
            }

            if (config_.silenceTimeoutMs > 0 && segmenter_.idleMs() >= config_.silenceTimeoutMs) {
                std::cout << "[Whisper STT] No speech for " << segmenter_.idleMs() << " ms" << std::endl;
                running_.store(false);
                enqueue(Job{Job::Kind::Timeout, {}, {}});
                finishCapture();
                return;
            }
        }

        // Whatever speech was still in progress becomes the final hypothesis
        Job last{Job::Kind::Final, {}, {}};
        if (segmenter_.inSpeech()) last.audio = segmenter_.utterance();
        segmenter_.reset();
        enqueue(std::move(last));
    } catch (const std::exception& e) {
        std::cerr << "[Whisper STT] [ERROR] " << e.what() << std::endl;
        running_.store(false);
        enqueue(Job{Job::Kind::Error, {}, e.what()});
    }
    finishCapture();
}

// Only the newest in-progress snapshot is worth transcribing
void WhisperSpeechSession::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job.kind == Job::Kind::Partial && !jobs_.empty() && jobs_.back().kind == Job::Kind::Partial) {
            jobs_.back() = std::move(job);
        } else {
            jobs_.push_back(std::move(job));
        }
    }
    cv_.notify_one();
}

void WhisperSpeechSession::finishCapture() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        captureDone_ = true;
    }
    cv_.notify_one();
}

// Transcription thread: runs the model and talks to the listener. After an
// error nothing else is delivered.
void WhisperSpeechSession::transcribe() {
    bool failed = false;

    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return !jobs_.empty() || captureDone_; });
            if (jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        if (failed) continue;

        if (job.kind == Job::Kind::Error) {
            failed = true;
            listener_.onError(job.message);
            continue;
        }

        try {
            deliver(job);
        } catch (const std::exception& e) {
            std::cerr << "[Whisper STT] [ERROR] " << e.what() << std::endl;
            failed = true;
            running_.store(false);
            listener_.onError(e.what());
        }
    }
}

void WhisperSpeechSession::deliver(const Job& job) {
    switch (job.kind) {
        case Job::Kind::Partial:
            listener_.onPartialResult(Hypothesis{model_.transcribe(job.audio)});
            break;
        case Job::Kind::Result:
            listener_.onResult(Hypothesis{model_.transcribe(job.audio)});
            break;
        case Job::Kind::Final:
            listener_.onFinalResult(Hypothesis{job.audio.empty() ? std::string() : model_.transcribe(job.audio)});
            break;
        case Job::Kind::Timeout:
            listener_.onTimeout();
            break;
        case Job::Kind::Error:
            listener_.onError(job.message);
            break;
    }
}
