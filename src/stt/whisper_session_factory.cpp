#include "audio/microphone_stream.hpp"
#include "stt/whisper_session.hpp"

std::unique_ptr<RecognizerSession> WhisperSessionFactory::start(SpeechModel& model, RecognitionListener& listener) {
    auto mic = std::make_unique<MicrophoneStream>(config_.audio.sampleRate, config_.audio.framesPerBuffer);
    return std::make_unique<WhisperSpeechSession>(model, listener, config_, std::move(mic));
}
