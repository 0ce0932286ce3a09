// src/video/Display.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "Plane.hpp"

// ============================================================================
// CHIP-8 VIDEO CONSTANTS
// ============================================================================
// Standard mode is 64×32.  SUPER-CHIP extended mode doubles both axes.
// XO-CHIP adds a second bit plane; the two bits of a pixel select one of
// four palette entries (plane 0 = bit 0, plane 1 = bit 1).
// ============================================================================

constexpr size_t CHIP8_WIDTH      = 64;
constexpr size_t CHIP8_HEIGHT     = 32;
constexpr size_t CHIP8_EXT_WIDTH  = CHIP8_WIDTH * 2;   // 128
constexpr size_t CHIP8_EXT_HEIGHT = CHIP8_HEIGHT * 2;  // 64
constexpr size_t PLANE_COUNT      = 2;

// Colors are 0x00RRGGBB
using Palette = std::array<uint32_t, 4>;
constexpr Palette DEFAULT_PALETTE = {0x00AA4400, 0x00FFAA00, 0x00AAAAAA, 0x00000000};

enum class ScrollDirection { DOWN, UP, LEFT, RIGHT };

// A finished picture handed to the frontend: one color per pixel, row-major.
struct Frame {
    std::vector<uint32_t> pixels;
    size_t width  = 0;
    size_t height = 0;
};

// Owns both planes, the active-plane mask and the palette.  Every operation
// that changes pixels bumps updates() and raises updated(); reads never do.
class Display {
public:
    Display();

    void clear();
    void scroll(ScrollDirection dir, unsigned amount);

    // Draw `count` sprite bytes on the active planes.  With both planes
    // active the range is split: first half to plane 0, second to plane 1.
    bool write_sprite(const uint8_t* sprite, size_t count, unsigned x, unsigned y);

    // 16×16 form: 32 bytes per active plane.
    bool write_sprite16(const uint8_t* sprite, size_t count, unsigned x, unsigned y);

    // Switch between 64×32 and 128×64.  Reallocates and zeroes every plane.
    void set_extended(bool ext);
    bool extended() const { return extended_; }

    Frame to_frame() const;

    size_t width() const  { return width_; }
    size_t height() const { return height_; }

    uint8_t active_planes() const { return active_planes_; }
    void    set_active_planes(uint8_t mask) { active_planes_ = mask & 0x03; }

    const Palette& palette() const { return palette_; }
    void set_palette(const Palette& p) { palette_ = p; }

    const Plane& plane(size_t i) const { return planes_[i]; }

    uint64_t updates() const { return updates_; }
    bool     updated() const { return updated_; }
    void     acknowledge() { updated_ = false; }

private:
    std::vector<Plane> planes_;
    size_t   width_         = CHIP8_WIDTH;
    size_t   height_        = CHIP8_HEIGHT;
    bool     extended_      = false;
    uint8_t  active_planes_ = 0x01;
    Palette  palette_       = DEFAULT_PALETTE;
    uint64_t updates_       = 0;
    bool     updated_       = true;

    bool plane_active(size_t i) const { return (active_planes_ >> i) & 0x01; }
    void flag_updated();
};
