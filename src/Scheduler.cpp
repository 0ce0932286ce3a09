// src/Scheduler.cpp
#include "Scheduler.hpp"
#include "AudioPatternPort.hpp"
#include "PerfLimiter.hpp"
#include "cpu/chip8.hpp"
#include <cstdio>
#include <iostream>

EngineChannels EngineChannels::create() {
    EngineChannels ch;
    ch.keys        = std::make_shared<Mailbox<KeyState>>();
    ch.frame_ready = std::make_shared<Mailbox<FrameReady>>();
    ch.frames      = std::make_shared<Mailbox<Frame>>();
    return ch;
}

void EngineChannels::close_all() const {
    if (keys)        keys->close();
    if (frame_ready) frame_ready->close();
    if (frames)      frames->close();
}

Scheduler::Scheduler(Chip8& cpu, Bus& bus, Display& display, EngineChannels channels,
                     SchedulerOptions opts, AudioPatternPort* audio)
    : cpu_(cpu), bus_(bus), display_(display),
      channels_(std::move(channels)), opts_(opts), audio_(audio) {}

Scheduler::~Scheduler() {
    if (thread_.joinable()) {
        channels_.close_all();
        thread_.join();
    }
}

void Scheduler::start() {
    running_ = true;
    thread_  = std::thread([this] { run(); });
}

void Scheduler::join() {
    if (thread_.joinable()) thread_.join();
}

void Scheduler::run() {
    running_ = true;
    try {
        if (audio_) audio_->start();
        loop();
    } catch (const CpuError& e) {
        std::cerr << "[CPU] Fatal: " << e.what() << "\n";
        debugger_.dump();
        error_ = std::current_exception();
    } catch (...) {
        error_ = std::current_exception();
    }
    // Whatever ended the loop, the frontend learns of it through the channels.
    channels_.close_all();
    running_ = false;
}

// ============================================================================
// FRAME HANDSHAKE
// ============================================================================
Scheduler::FrameSend Scheduler::send_frame() {
    if (opts_.delivery == FrameDelivery::SKIP) {
        switch (channels_.frame_ready->try_put(FrameReady{})) {
            case SendResult::FULL:
                frames_dropped_++;
                return FrameSend::DROPPED;
            case SendResult::CLOSED:
                return FrameSend::CLOSED;
            case SendResult::OK:
                break;
        }
    } else if (!channels_.frame_ready->put(FrameReady{})) {
        return FrameSend::CLOSED;
    }

    if (!channels_.frames->put(display_.to_frame())) return FrameSend::CLOSED;
    frames_sent_++;
    return FrameSend::SENT;
}

// Returns false once the frontend has gone away.
bool Scheduler::poll_keys() {
    KeyState keys;
    switch (channels_.keys->try_take(keys)) {
        case RecvResult::OK:     bus_.set_keys(keys); return true;
        case RecvResult::EMPTY:  return true;
        case RecvResult::CLOSED: return false;
    }
    return false;
}

// ============================================================================
// ENGINE LOOP
// ============================================================================
void Scheduler::loop() {
    PerfLimiter perf_cpu(opts_.ips_limit);
    PerfLimiter ticker(1.0);

    while (true) {
        if (opts_.debug >= 2) {
            const KeyState& keys = bus_.get_keys();
            printf("[CPU] keys=");
            for (bool k : keys) printf("%c", k ? '1' : '0');
            printf("\n[CPU] ");
            cpu_.print_state(stdout);
        }

        debugger_.record(cpu_);
        bool executed = cpu_.tick();

        if (cpu_.exited()) {
            std::cout << "[CPU] Program exited at PC=0x" << std::hex << cpu_.get_pc()
                      << std::dec << "\n";
            break;
        }

        // Drawing usually takes several instructions, so a frame sent only on
        // change is often half drawn.  Sampling after every tick makes most
        // delivered frames complete ones.  A change whose frame was dropped
        // stays pending and goes out on a later tick.
        if (opts_.reduce_flicker || display_.updated()) {
            FrameSend result = send_frame();
            if (result == FrameSend::CLOSED) break;
            if (result == FrameSend::SENT) display_.acknowledge();
        }

        if (!poll_keys()) break;

        if (executed) {
            ticks_++;
            perf_cpu.wait();
        } else {
            std::this_thread::sleep_for(IDLE_SLEEP);
        }

        if (!ticker.wait_nonblocking() && opts_.debug >= 1) {
            std::cout << "[PERF] instructions per second (ips): "
                      << static_cast<uint64_t>(perf_cpu.rate()) << "\n";
        }
    }
}
