// src/Scheduler.hpp
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <thread>
#include "Debugger.hpp"
#include "Mailbox.hpp"
#include "system/Bus.hpp"
#include "video/Display.hpp"

class Chip8;
class AudioPatternPort;

// Payload-free "a frame is on its way" notice.
struct FrameReady {};

// The only state shared between the engine thread and the frontend.
//   keys        frontend -> engine, latest snapshot, dropped when full
//   frame_ready engine -> frontend, sent before each frame payload
//   frames      engine -> frontend, the frame itself
// Closing any of them from either side stops the engine.
struct EngineChannels {
    std::shared_ptr<Mailbox<KeyState>>   keys;
    std::shared_ptr<Mailbox<FrameReady>> frame_ready;
    std::shared_ptr<Mailbox<Frame>>      frames;

    static EngineChannels create();
    void close_all() const;
};

enum class FrameDelivery {
    SKIP,    // drop the new frame if the last one is still unread
    BLOCK,   // wait for the frontend; the engine runs at its pace
};

struct SchedulerOptions {
    std::optional<double> ips_limit;
    FrameDelivery         delivery       = FrameDelivery::SKIP;
    bool                  reduce_flicker = true;   // frame after every tick
    int                   debug          = 0;
};

// Runs the interpreter on its own thread.  Once started, the CPU, display,
// bus and audio port belong to that thread until join() returns.
class Scheduler {
public:
    // Sleep used when the CPU is parked on Fx0A and consumed no rate slot.
    static constexpr std::chrono::milliseconds IDLE_SLEEP{1};

    Scheduler(Chip8& cpu, Bus& bus, Display& display, EngineChannels channels,
              SchedulerOptions opts, AudioPatternPort* audio = nullptr);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start();
    void join();

    // The loop itself.  start() runs it on a new thread; tests may call it
    // directly.  Returns when a channel closes, the program exits, or the
    // engine faults.
    void run();

    bool     running() const { return running_; }
    uint64_t ticks() const { return ticks_; }
    uint64_t frames_sent() const { return frames_sent_; }
    uint64_t frames_dropped() const { return frames_dropped_; }

    // Exception that ended the loop, or null after a normal shutdown.
    std::exception_ptr error() const { return error_; }

    const Debugger& debugger() const { return debugger_; }

private:
    Chip8&            cpu_;
    Bus&              bus_;
    Display&          display_;
    EngineChannels    channels_;
    SchedulerOptions  opts_;
    AudioPatternPort* audio_;
    Debugger          debugger_;

    std::thread           thread_;
    std::atomic<bool>     running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> frames_dropped_{0};
    std::exception_ptr    error_;

    enum class FrameSend { SENT, DROPPED, CLOSED };

    FrameSend send_frame();
    bool      poll_keys();
    void loop();
};
