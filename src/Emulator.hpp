#pragma once
#include "system/Bus.hpp"
#include "cpu/chip8.hpp"
#include "video/Display.hpp"
#include "video/Window.hpp"
#include "Config.hpp"
#include "Sound.hpp"

// Top-level emulator.  Owns the Bus, Display, CPU and frontend devices.
// Call init() once, then run() to enter the main loop.
//
// run() hands the Bus, Display, CPU and Sound to the scheduler thread and
// only touches them again after joining it; the main thread keeps the
// window and talks to the engine through the scheduler's channels.
class Emulator {
public:
    bool init(int argc, char* argv[]);

    // Returns the process exit status.
    int run();

private:
    // Member declaration order matters: bus_ and display_ must precede cpu_
    // so that both are fully constructed before cpu_(bus_, display_) runs.
    Config  config_;
    Bus     bus_;
    Display display_;
    Chip8   cpu_{bus_, display_};

    Window  window_;
    Sound   sound_;
};
