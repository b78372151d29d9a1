#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "app/event_router.hpp"
#include "model/model_preparer.hpp"
#include "stt/whisper_session.hpp"
#include "stt/whisper_stt.hpp"

#include <string>

struct Settings {
    ModelPreparer::Config model;
    WhisperModel::Params whisper;
    WhisperSpeechSession::Config session;
    RecognitionEventRouter::Policy transcript;

    // Remembered microphone consent.
    bool microphoneConsent = false;
};

// Reads path as JSON over the defaults. A missing file yields the defaults;
// an unreadable or malformed one is logged and also yields the defaults.
Settings loadSettings(const std::string& path);

// Returns false if the file could not be written.
bool saveSettings(const Settings& settings, const std::string& path);

#endif
