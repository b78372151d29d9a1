#ifndef SPEECH_SEGMENTER_HPP
#define SPEECH_SEGMENTER_HPP

#include <vector>
#include <cstdint>

// Energy-based voice activity detector that cuts a 16 kHz mono stream into
// utterances.
class SpeechSegmenter {
public:
    struct Config {
        int sampleRate = 16000;

        int framesPerBuffer = 160;

        float vadStartRms = 0.014f;
        float vadStopRms = 0.011f;
        int startHangMs = 80;
        int stopHangMs = 550;

        int maxUtteranceMs = 12000;
        int preRollMs = 250;
    };

    enum class Event {
        None,
        SpeechStarted,
        UtteranceComplete
    };

    explicit SpeechSegmenter(Config config);

    Event feed(const int16_t* samples, int frames);

    bool inSpeech() const { return listening_; }
    bool hasUtterance() const { return finished_; }

    // Audio of the current utterance, complete or still in progress.
    const std::vector<float>& utterance() const { return utterance_; }
    int utteranceMs() const { return utteranceMs_; }

    // Time since the last completed utterance, or since reset, without speech.
    int idleMs() const { return idleMs_; }

    // Drops the finished utterance and waits for the next one.
    void nextUtterance();

    void reset();

private:
    Config config_;

    bool listening_ = false;
    bool finished_ = false;

    int speechMs_ = 0;
    int silenceMs_ = 0;
    int utteranceMs_ = 0;
    int idleMs_ = 0;

    std::vector<float> preRoll_;
    std::vector<float> utterance_;

    int durationMs(int frames) const;
    float rms(const float* x, int n) const;
    void pushPreRoll(const float* x, int n);
};

#endif
