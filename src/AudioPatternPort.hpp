// src/AudioPatternPort.hpp
#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>

// One playback cycle of 1-bit audio, MSB first: 16 bytes = 128 samples.
using SoundPattern = std::array<uint8_t, 16>;

// Default pattern: alternating bits (a square wave at half the bit rate).
constexpr SoundPattern DEFAULT_SOUND_PATTERN = {
    0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA,
    0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA,
};

// Audio output device could not be opened or has failed.
class AudioError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Where the engine hands sound requests.  Implementations turn the pattern
// into PCM and play it; the engine knows nothing about devices or threads.
class AudioPatternPort {
public:
    virtual ~AudioPatternPort() = default;

    // Called once from the engine thread before the first tick.  Throws
    // AudioError if the device is unusable.
    virtual void start() {}

    // The sound timer was armed with a non-zero value: play `pattern` on
    // repeat for `duration`, replacing anything still playing.
    virtual void on_arm(const SoundPattern& pattern,
                        std::chrono::nanoseconds duration) = 0;
};
