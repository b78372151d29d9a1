#ifndef MICROPHONE_STREAM_HPP
#define MICROPHONE_STREAM_HPP

#include "audio/audio_source.hpp"

#include <cstdint>

// Blocking 16-bit mono capture from the default PortAudio input device.
// The constructor initializes PortAudio and starts the stream; the destructor
// undoes both. Failures throw std::runtime_error carrying PortAudio's text.
class MicrophoneStream : public AudioSource {
public:
    MicrophoneStream(int sampleRate, int framesPerBuffer);
    ~MicrophoneStream() override;

    MicrophoneStream(const MicrophoneStream&) = delete;
    MicrophoneStream& operator=(const MicrophoneStream&) = delete;

    // An input overflow is not an error; the buffer holds whatever PortAudio
    // delivered.
    void read(int16_t* out, int frames) override;

private:
    void close();

    bool initialized_ = false;
    void* stream_ = nullptr;
};

#endif
