#include "audio/speech_segmenter.hpp"

#include <cmath>
#include <algorithm>

// Constructor
SpeechSegmenter::SpeechSegmenter(Config config) : config_(config) {
    preRoll_.reserve((config_.preRollMs * config_.sampleRate) / 1000);
    utterance_.reserve((config_.maxUtteranceMs * config_.sampleRate) / 1000);
}

// Forgets everything, including the idle time
void SpeechSegmenter::reset() {
    nextUtterance();
    idleMs_ = 0;
    preRoll_.clear();
}

void SpeechSegmenter::nextUtterance() {
    listening_ = false;
    finished_ = false;
    speechMs_ = 0;
    silenceMs_ = 0;
    utteranceMs_ = 0;
    utterance_.clear();
}

int SpeechSegmenter::durationMs(int frames) const {
    return (int)std::lround(1000.0 * frames / std::max(1, config_.sampleRate));
}

float SpeechSegmenter::rms(const float* x, int n) const {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) acc += (double)x[i] * (double)x[i];
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

// Keeps the last preRollMs of audio so utterance onsets are not clipped
void SpeechSegmenter::pushPreRoll(const float* x, int n) {
    const int maxPre = (config_.preRollMs * config_.sampleRate) / 1000;
    preRoll_.insert(preRoll_.end(), x, x + n);
    if ((int)preRoll_.size() > maxPre) {
        const int extra = (int)preRoll_.size() - maxPre;
        preRoll_.erase(preRoll_.begin(), preRoll_.begin() + extra);
    }
}

SpeechSegmenter::Event SpeechSegmenter::feed(const int16_t* samples, int frames) {
    if (finished_ || frames <= 0) return Event::None;

    std::vector<float> framesFloat(frames);
    for (int i = 0; i < frames; ++i) framesFloat[i] = (float)samples[i] / 32768.0f;

    const int ms = durationMs(frames);
    const float r = rms(framesFloat.data(), frames);

    if (!listening_) {
        idleMs_ += ms;
        pushPreRoll(framesFloat.data(), frames);
        if (r < config_.vadStartRms) {
            speechMs_ = 0;
            return Event::None;
        }

        speechMs_ += ms;
        if (speechMs_ < config_.startHangMs) return Event::None;

        listening_ = true;
        idleMs_ = 0;
        silenceMs_ = 0;
        utterance_.insert(utterance_.end(), preRoll_.begin(), preRoll_.end());
        utteranceMs_ = durationMs((int)preRoll_.size());
        preRoll_.clear();
        return Event::SpeechStarted;
    }

    utterance_.insert(utterance_.end(), framesFloat.begin(), framesFloat.end());
    utteranceMs_ += ms;

    if (r <= config_.vadStopRms) {
        silenceMs_ += ms;
    } else {
        silenceMs_ = 0;
    }

    if (silenceMs_ >= config_.stopHangMs || utteranceMs_ >= config_.maxUtteranceMs) {
        finished_ = true;
        listening_ = false;
        return Event::UtteranceComplete;
    }

    return Event::None;
}
