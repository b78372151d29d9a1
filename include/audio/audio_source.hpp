#ifndef AUDIO_SOURCE_HPP
#define AUDIO_SOURCE_HPP

#include <cstdint>

// Blocking source of 16-bit mono samples at the segmenter's sample rate.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    // Fills out with exactly frames samples, waiting for them if needed.
    // Throws std::runtime_error when the device fails.
    virtual void read(int16_t* out, int frames) = 0;
};

#endif
