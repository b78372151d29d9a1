#include "audio/microphone_stream.hpp"

#include <portaudio.h>
#include <iostream>
#include <stdexcept>
#include <string>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor. Cleans up after itself if any step fails
MicrophoneStream::MicrophoneStream(int sampleRate, int framesPerBuffer) {
    pa_check(Pa_Initialize(), "Pa_Initialize");
    initialized_ = true;

    try {
        PaStreamParameters inParams{};
        inParams.device = Pa_GetDefaultInputDevice();
        if (inParams.device == paNoDevice) {
            throw std::runtime_error("No default input device");
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
        std::cout << "[Microphone] Input device: " << (info ? info->name : "(unknown)") << std::endl;

        inParams.channelCount = 1;
        inParams.sampleFormat = paInt16;
        inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
        inParams.hostApiSpecificStreamInfo = nullptr;

        PaStream* stream = nullptr;
        pa_check(
            Pa_OpenStream(&stream, &inParams, nullptr,
                          sampleRate, framesPerBuffer,
                          paNoFlag, nullptr, nullptr),
            "Pa_OpenStream"
        );
        stream_ = stream;

        pa_check(Pa_StartStream(stream), "Pa_StartStream");
    } catch (...) {
        close();
        throw;
    }
}

// Destructor
MicrophoneStream::~MicrophoneStream() { close(); }

void MicrophoneStream::read(int16_t* out, int frames) {
    PaError e = Pa_ReadStream(static_cast<PaStream*>(stream_), out, frames);
    if (e == paInputOverflowed) {
        std::cerr << "[Microphone] [WARN] Input overflowed" << std::endl;
        return;
    }
    pa_check(e, "Pa_ReadStream");
}

void MicrophoneStream::close() {
    if (stream_) {
        PaStream* stream = static_cast<PaStream*>(stream_);
        Pa_StopStream(stream);
        Pa_CloseStream(stream);
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}
