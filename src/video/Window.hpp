// src/video/Window.hpp
#pragma once
#include <SDL.h>
#include <cstddef>
#include <string>
#include "Display.hpp"
#include "../system/Bus.hpp"

// SDL window that presents frames from the engine and reads the keypad.
//
// Host keys map onto the hex keypad in the usual 4×4 block:
//   1 2 3 4      1 2 3 C
//   Q W E R  ->  4 5 6 D
//   A S D F      7 8 9 E
//   Z X C V      A 0 B F
class Window {
public:
    Window() = default;
    ~Window();

    // Initialize SDL video, window and renderer
    bool init(const std::string& title, int scale);
    void cleanup();

    // Upload and present a frame; the texture follows frame size changes.
    void render_frame(const Frame& frame);

    // Poll SDL events into `keys`.  Returns false once the user quits.
    bool handle_events(KeyState& keys);

    // Keypad index for a host scancode, or -1.
    static int map_scancode(SDL_Scancode sc);

private:
    SDL_Window*   window         = nullptr;
    SDL_Renderer* renderer       = nullptr;
    SDL_Texture*  screen_texture = nullptr;
    size_t        tex_width      = 0;
    size_t        tex_height     = 0;
    bool          running        = true;
    bool          video_up       = false;

    bool ensure_texture(size_t width, size_t height);
};
