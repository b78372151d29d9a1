#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/recognition.hpp"

#include <string>
#include <vector>

struct whisper_context;

// A loaded whisper.cpp model. Construction throws std::runtime_error if the
// model file cannot be loaded.
class WhisperModel : public SpeechModel {
public:
    struct Params {
        std::string language = "en";
        int threads = 4;
        float noSpeechThold = 0.6f;
        bool useGpu = false;
    };

    WhisperModel(const std::string& modelPath, Params params);
    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    std::string transcribe(const std::vector<float>& pcm16kMono) override;

private:
    Params params_;
    whisper_context* context_ = nullptr;
};

#endif
