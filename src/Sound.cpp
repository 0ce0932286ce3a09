#include "Sound.hpp"
#include <iostream>
#include <string>

Sound::~Sound() {
    cleanup();
}

void Sound::start() {
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        throw AudioError(std::string("SDL_InitSubSystem(AUDIO) failed: ") +
                         SDL_GetError());
    }

    SDL_AudioSpec want{}, have{};
    want.freq     = SAMPLE_RATE;
    want.format   = AUDIO_S16SYS;
    want.channels = 1;
    want.samples  = 512;       // internal buffer size (≈11.6 ms)
    want.callback = nullptr;   // queue mode: we push via SDL_QueueAudio

    device_ = SDL_OpenAudioDevice(nullptr, 0, &want, &have, 0);
    if (device_ == 0) {
        std::string err = SDL_GetError();
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        throw AudioError("SDL_OpenAudioDevice failed: " + err);
    }

    // Longest tone is 255 timer steps, ~4.25 s at 60 Hz
    buf_.reserve(SAMPLE_RATE * 256 / 60);

    SDL_PauseAudioDevice(device_, 0);  // start playback
    std::cout << "[SOUND] Audio opened: " << have.freq << " Hz, "
              << (int)have.channels << " ch, "
              << "buffer " << have.samples << " samples\n";
}

void Sound::cleanup() {
    if (device_) {
        SDL_CloseAudioDevice(device_);
        device_ = 0;
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
    }
}

const std::vector<int16_t>& Sound::render(const SoundPattern& pattern,
                                          std::chrono::nanoseconds duration) {
    buf_.clear();
    std::chrono::duration<double> secs = duration;
    size_t samples = static_cast<size_t>(secs.count() * SAMPLE_RATE);
    constexpr size_t PATTERN_BITS = 16 * 8;

    for (size_t n = 0; n < samples; n++) {
        size_t  bit = static_cast<size_t>(n * PATTERN_RATE / SAMPLE_RATE) % PATTERN_BITS;
        bool    on  = (pattern[bit / 8] >> (7 - bit % 8)) & 0x01;
        float   raw = on ? 1.0f : -1.0f;

        // First-order IIR low-pass filter (RC circuit simulation):
        //   y[n] = α × x[n] + (1–α) × y[n–1]
        float lp = LP_ALPHA * raw + (1.0f - LP_ALPHA) * lp_state_;
        // DC-blocking high-pass filter:
        //   hp[n] = lp[n] – lp[n–1] + HP_ALPHA × hp[n–1]
        float hp = lp - lp_state_ + HP_ALPHA * hp_state_;

        lp_state_ = lp;
        hp_state_ = hp;
        buf_.push_back(static_cast<int16_t>(hp * AMPLITUDE));
    }
    return buf_;
}

void Sound::on_arm(const SoundPattern& pattern, std::chrono::nanoseconds duration) {
    if (device_ == 0) return;
    render(pattern, duration);

    // A new arm replaces the tone still playing.
    SDL_ClearQueuedAudio(device_);
    if (buf_.empty()) return;
    if (SDL_QueueAudio(device_, buf_.data(),
                       static_cast<uint32_t>(buf_.size() * sizeof(int16_t))) < 0) {
        throw AudioError(std::string("SDL_QueueAudio failed: ") + SDL_GetError());
    }
}
