#include "app/settings.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

using json = nlohmann::json;

Settings loadSettings(const std::string& path) {
    Settings settings;

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "[Settings] " << path << " not found, using defaults" << std::endl;
        return settings;
    }

    try {
        json j;
        file >> j;

        const json model = j.value("model", json::object());
        settings.model.assetsDir = model.value("assetsDir", settings.model.assetsDir);
        settings.model.dataDir = model.value("dataDir", settings.model.dataDir);
        settings.model.modelName = model.value("name", settings.model.modelName);
        settings.model.modelFile = model.value("file", settings.model.modelFile);

        const json whisper = j.value("whisper", json::object());
        settings.whisper.language = whisper.value("language", settings.whisper.language);
        settings.whisper.threads = whisper.value("threads", settings.whisper.threads);
        settings.whisper.noSpeechThold = whisper.value("noSpeechThold", settings.whisper.noSpeechThold);
        settings.whisper.useGpu = whisper.value("useGpu", settings.whisper.useGpu);

        SpeechSegmenter::Config& audio = settings.session.audio;
        const json a = j.value("audio", json::object());
        audio.framesPerBuffer = a.value("framesPerBuffer", audio.framesPerBuffer);
        audio.vadStartRms = a.value("vadStartRms", audio.vadStartRms);
        audio.vadStopRms = a.value("vadStopRms", audio.vadStopRms);
        audio.startHangMs = a.value("startHangMs", audio.startHangMs);
        audio.stopHangMs = a.value("stopHangMs", audio.stopHangMs);
        audio.maxUtteranceMs = a.value("maxUtteranceMs", audio.maxUtteranceMs);
        audio.preRollMs = a.value("preRollMs", audio.preRollMs);

        const json session = j.value("session", json::object());
        settings.session.partialIntervalMs = session.value("partialIntervalMs", settings.session.partialIntervalMs);
        settings.session.silenceTimeoutMs = session.value("silenceTimeoutMs", settings.session.silenceTimeoutMs);

        const json transcript = j.value("transcript", json::object());
        settings.transcript.throttleMs = transcript.value("throttleMs", settings.transcript.throttleMs);
        settings.transcript.stopOnFinalResult =
            transcript.value("stopOnFinalResult", settings.transcript.stopOnFinalResult);

        settings.microphoneConsent = j.value("microphoneConsent", settings.microphoneConsent);
        std::cout << "[Settings] Loaded " << path << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[Settings] [WARN] Failed to parse " << path << ": " << e.what() << std::endl;
        return Settings{};
    }

    return settings;
}

bool saveSettings(const Settings& settings, const std::string& path) {
    json j;
    j["model"] = {
        {"assetsDir", settings.model.assetsDir},
        {"dataDir", settings.model.dataDir},
        {"name", settings.model.modelName},
        {"file", settings.model.modelFile},
    };
    j["whisper"] = {
        {"language", settings.whisper.language},
        {"threads", settings.whisper.threads},
        {"noSpeechThold", settings.whisper.noSpeechThold},
        {"useGpu", settings.whisper.useGpu},
    };

    const SpeechSegmenter::Config& audio = settings.session.audio;
    j["audio"] = {
        {"framesPerBuffer", audio.framesPerBuffer},
        {"vadStartRms", audio.vadStartRms},
        {"vadStopRms", audio.vadStopRms},
        {"startHangMs", audio.startHangMs},
        {"stopHangMs", audio.stopHangMs},
        {"maxUtteranceMs", audio.maxUtteranceMs},
        {"preRollMs", audio.preRollMs},
    };
    j["session"] = {
        {"partialIntervalMs", settings.session.partialIntervalMs},
        {"silenceTimeoutMs", settings.session.silenceTimeoutMs},
    };
    j["transcript"] = {
        {"throttleMs", settings.transcript.throttleMs},
        {"stopOnFinalResult", settings.transcript.stopOnFinalResult},
    };
    j["microphoneConsent"] = settings.microphoneConsent;

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Settings] [ERROR] Cannot write " << path << std::endl;
        return false;
    }
    file << j.dump(2) << "\n";
    return file.good();
}
