// src/video/Window.cpp
#include "Window.hpp"
#include <iostream>

Window::~Window() {
    cleanup();
}

// ============================================================================
// SDL INITIALIZATION
// ============================================================================
bool Window::init(const std::string& title, int scale) {
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) < 0) {
        std::cerr << "[VIDEO] SDL Video Init Failed: " << SDL_GetError() << std::endl;
        return false;
    }
    video_up = true;

    // Sized for extended mode; standard frames are stretched to fit.
    window = SDL_CreateWindow(
        title.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        static_cast<int>(CHIP8_EXT_WIDTH) * scale / 2,
        static_cast<int>(CHIP8_EXT_HEIGHT) * scale / 2,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );

    if (!window) {
        std::cerr << "[VIDEO] SDL Window Creation Failed: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::cerr << "[VIDEO] SDL Renderer Creation Failed: " << SDL_GetError() << std::endl;
        return false;
    }

    // Set scaling quality to nearest-neighbor (pixel-perfect)
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "nearest");

    if (!ensure_texture(CHIP8_WIDTH, CHIP8_HEIGHT)) return false;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    SDL_RenderPresent(renderer);

    std::cout << "[VIDEO] Window initialized, scale " << scale << std::endl;
    return true;
}

void Window::cleanup() {
    if (screen_texture) {
        SDL_DestroyTexture(screen_texture);
        screen_texture = nullptr;
    }
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    if (video_up) {
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        video_up = false;
    }
}

bool Window::ensure_texture(size_t width, size_t height) {
    if (screen_texture && width == tex_width && height == tex_height) return true;
    if (screen_texture) SDL_DestroyTexture(screen_texture);

    // Frame colors are 0x00RRGGBB
    screen_texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_RGB888,
        SDL_TEXTUREACCESS_STREAMING,
        static_cast<int>(width),
        static_cast<int>(height)
    );
    if (!screen_texture) {
        std::cerr << "[VIDEO] SDL Texture Creation Failed: " << SDL_GetError() << std::endl;
        return false;
    }
    tex_width  = width;
    tex_height = height;
    return true;
}

// ============================================================================
// FRAME RENDERING
// ============================================================================
void Window::render_frame(const Frame& frame) {
    if (frame.pixels.size() != frame.width * frame.height || frame.width == 0) return;
    if (!ensure_texture(frame.width, frame.height)) return;

    SDL_UpdateTexture(
        screen_texture,
        nullptr,
        frame.pixels.data(),
        static_cast<int>(frame.width * sizeof(uint32_t))
    );

    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, screen_texture, nullptr, nullptr);
    SDL_RenderPresent(renderer);
}

// ============================================================================
// INPUT HANDLING
// ============================================================================
int Window::map_scancode(SDL_Scancode sc) {
    switch (sc) {
        case SDL_SCANCODE_X: return 0x0;
        case SDL_SCANCODE_1: return 0x1;
        case SDL_SCANCODE_2: return 0x2;
        case SDL_SCANCODE_3: return 0x3;
        case SDL_SCANCODE_Q: return 0x4;
        case SDL_SCANCODE_W: return 0x5;
        case SDL_SCANCODE_E: return 0x6;
        case SDL_SCANCODE_A: return 0x7;
        case SDL_SCANCODE_S: return 0x8;
        case SDL_SCANCODE_D: return 0x9;
        case SDL_SCANCODE_Z: return 0xA;
        case SDL_SCANCODE_C: return 0xB;
        case SDL_SCANCODE_4: return 0xC;
        case SDL_SCANCODE_R: return 0xD;
        case SDL_SCANCODE_F: return 0xE;
        case SDL_SCANCODE_V: return 0xF;
        default: return -1;
    }
}

bool Window::handle_events(KeyState& keys) {
    SDL_Event event;

    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_QUIT) {
            running = false;
            return false;
        }

        if (event.type == SDL_KEYDOWN || event.type == SDL_KEYUP) {
            bool pressed = (event.type == SDL_KEYDOWN);
            SDL_Scancode sc = event.key.keysym.scancode;

            if (sc == SDL_SCANCODE_ESCAPE && pressed) {
                running = false;
                return false;
            }

            int key = map_scancode(sc);
            if (key >= 0) keys[key] = pressed;
        }
    }

    return running;
}
