#pragma once
#include <cstdint>
#include <vector>
#include <SDL.h>
#include "AudioPatternPort.hpp"

// 1-bit pattern playback through an SDL queued-audio device.
//
// The sound timer arms a 128-bit pattern that repeats at PATTERN_RATE bits
// per second for the timer's remaining duration.  Each arm replaces what is
// still queued.  The raw ±1 square edges are smoothed with a first-order IIR
// low-pass (removes the harsh aliasing of hard edges at 44.1 kHz) followed by
// a DC-blocking high-pass so silence sits at zero and starting or stopping
// a tone does not pop.
class Sound : public AudioPatternPort {
public:
    static constexpr int      SAMPLE_RATE  = 44100;
    // Pattern bits per second
    static constexpr double   PATTERN_RATE = 4000.0;
    // IIR α for ~4 kHz cutoff at 44100 Hz:
    //   RC = 1/(2π × 4000) ≈ 39.8 µs,  dt = 1/44100 ≈ 22.7 µs
    //   α = dt / (RC + dt) ≈ 0.363
    static constexpr float    LP_ALPHA     = 0.363f;
    // DC-blocking high-pass, fc ≈ 7 Hz
    static constexpr float    HP_ALPHA     = 0.999f;
    // Output amplitude (int16_t peak).  Half of max to leave headroom.
    static constexpr int16_t  AMPLITUDE    = 16384;

    ~Sound() override;

    // Open the SDL audio device.  Throws AudioError on failure.
    void start() override;
    void cleanup();

    void on_arm(const SoundPattern& pattern, std::chrono::nanoseconds duration) override;

    // Render `duration` of `pattern` into buf_ (exposed for inspection).
    const std::vector<int16_t>& render(const SoundPattern& pattern,
                                       std::chrono::nanoseconds duration);

private:
    SDL_AudioDeviceID device_   = 0;
    float             lp_state_ = 0.0f;  // LP filter state (–1.0 … +1.0)
    float             hp_state_ = 0.0f;  // DC-blocking HP filter state
    std::vector<int16_t> buf_;
};
