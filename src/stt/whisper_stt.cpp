#include "stt/whisper_stt.hpp"

#include <whisper.h>
#include <iostream>
#include <stdexcept>
#include <utility>

// Constructor
WhisperModel::WhisperModel(const std::string& modelPath, Params params) : params_(std::move(params)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = params_.useGpu;
    cparams.flash_attn = false;

    std::cout << "[Whisper STT] Loading " << modelPath << std::endl;
    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + modelPath);
}

// Destructor
WhisperModel::~WhisperModel() {
    if (context_) whisper_free(context_);
}

// Converts pcm16kMono into text; segments are concatenated as whisper returns them
std::string WhisperModel::transcribe(const std::vector<float>& pcm16kMono) {
    if (pcm16kMono.empty()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = params_.threads;
    params.language = params_.language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.single_segment = true;

    params.no_speech_thold = params_.noSpeechThold;

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (rc != 0) throw std::runtime_error("whisper_full failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);
    return out;
}
