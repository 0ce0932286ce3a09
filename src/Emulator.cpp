#include "Emulator.hpp"
#include "PerfLimiter.hpp"
#include "Scheduler.hpp"
#include <iostream>
#include <SDL.h>

bool Emulator::init(int argc, char* argv[]) {
    std::cout << "╔════════════════════════════════════════╗\n"
              << "║           Welcome to chipxo            ║\n"
              << "║  CHIP-8 / SUPER-CHIP / XO-CHIP VM      ║\n"
              << "╚════════════════════════════════════════╝\n";

    std::optional<Config> cfg = parse_config(argc, argv);
    if (!cfg) return false;
    config_ = *cfg;

    try {
        bus_.load_rom(config_.rom_path);
    } catch (const RomError& e) {
        std::cerr << "[ROM] Load Failed: " << e.what() << "\n";
        return false;
    }

    if (config_.colors) display_.set_palette(*config_.colors);
    cpu_.set_timer_speed(config_.timer_speed);
    cpu_.set_audio_port(&sound_);

    if (!window_.init("chipxo - " + config_.rom_path, config_.scale)) {
        std::cerr << "[VIDEO] Failed to initialize display\n";
        window_.cleanup();
        return false;
    }
    return true;
}

int Emulator::run() {
    EngineChannels channels = EngineChannels::create();

    SchedulerOptions opts;
    opts.ips_limit      = config_.ips_limit;
    opts.delivery       = config_.skip_frames ? FrameDelivery::SKIP : FrameDelivery::BLOCK;
    opts.reduce_flicker = config_.reduce_flicker;
    opts.debug          = config_.debug;

    Scheduler scheduler(cpu_, bus_, display_, channels, opts, &sound_);
    scheduler.start();

    PerfLimiter perf_io(config_.fps_limit);
    PerfLimiter ticker(1.0);
    KeyState    keys{};

    while (window_.handle_events(keys)) {
        if (channels.keys->try_put(keys) == SendResult::CLOSED) break;

        FrameReady notice;
        RecvResult ready = channels.frame_ready->try_take(notice);
        if (ready == RecvResult::CLOSED) break;
        if (ready == RecvResult::OK) {
            std::optional<Frame> frame = channels.frames->take();
            if (!frame) break;
            window_.render_frame(*frame);
        }

        perf_io.wait();
        if (!config_.fps_limit && ready == RecvResult::EMPTY)
            SDL_Delay(1);

        if (!ticker.wait_nonblocking() && config_.debug >= 1) {
            std::cout << "[PERF] frames per second       (fps): "
                      << static_cast<uint64_t>(perf_io.rate()) << "\n";
        }
    }

    // Closing the channels is the engine's stop signal.
    channels.close_all();
    scheduler.join();
    sound_.cleanup();
    window_.cleanup();

    int status = 0;
    if (std::exception_ptr err = scheduler.error()) {
        try {
            std::rethrow_exception(err);
        } catch (const std::exception& e) {
            std::cerr << "[CPU] Engine stopped: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[CPU] Engine stopped by an unknown error\n";
        }
        status = 1;
    }
    std::cout << "chipxo shutdown complete.\n";
    return status;
}
