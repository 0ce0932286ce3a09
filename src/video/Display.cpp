// src/video/Display.cpp
#include "Display.hpp"

Display::Display() {
    planes_.assign(PLANE_COUNT, Plane(width_, height_));
}

void Display::flag_updated() {
    updated_ = true;
    updates_++;
}

void Display::set_extended(bool ext) {
    width_    = ext ? CHIP8_EXT_WIDTH  : CHIP8_WIDTH;
    height_   = ext ? CHIP8_EXT_HEIGHT : CHIP8_HEIGHT;
    extended_ = ext;
    planes_.assign(PLANE_COUNT, Plane(width_, height_));
    flag_updated();
}

// ============================================================================
// PLANE OPERATIONS (active planes only)
// ============================================================================
void Display::clear() {
    for (size_t i = 0; i < planes_.size(); i++) {
        if (plane_active(i)) planes_[i].clear();
    }
    flag_updated();
}

void Display::scroll(ScrollDirection dir, unsigned amount) {
    for (size_t i = 0; i < planes_.size(); i++) {
        if (!plane_active(i)) continue;
        switch (dir) {
            case ScrollDirection::DOWN:  planes_[i].scroll_down(amount); break;
            case ScrollDirection::UP:    planes_[i].scroll_up(amount);   break;
            case ScrollDirection::RIGHT: planes_[i].scroll_right();      break;
            case ScrollDirection::LEFT:  planes_[i].scroll_left();       break;
        }
    }
    flag_updated();
}

bool Display::write_sprite(const uint8_t* sprite, size_t count, unsigned x, unsigned y) {
    bool collision = false;
    if (active_planes_ == 0x03) {
        size_t half = count / 2;
        collision |= planes_[0].write_sprite(sprite, half, x, y);
        collision |= planes_[1].write_sprite(sprite + half, count - half, x, y);
    } else {
        for (size_t i = 0; i < planes_.size(); i++) {
            if (plane_active(i))
                collision |= planes_[i].write_sprite(sprite, count, x, y);
        }
    }
    flag_updated();
    return collision;
}

bool Display::write_sprite16(const uint8_t* sprite, size_t count, unsigned x, unsigned y) {
    bool collision = false;
    if (active_planes_ == 0x03 && count >= 64) {
        collision |= planes_[0].write_sprite16(sprite, x, y);
        collision |= planes_[1].write_sprite16(sprite + 32, x, y);
    } else if (count >= 32) {
        for (size_t i = 0; i < planes_.size(); i++) {
            if (plane_active(i))
                collision |= planes_[i].write_sprite16(sprite, x, y);
        }
    }
    flag_updated();
    return collision;
}

// ============================================================================
// FRAME OUTPUT
// ============================================================================
Frame Display::to_frame() const {
    Frame frame;
    frame.width  = width_;
    frame.height = height_;
    frame.pixels.reserve(width_ * height_);

    const std::vector<uint8_t>& p0 = planes_[0].cells();
    const std::vector<uint8_t>& p1 = planes_[1].cells();
    size_t bpr = width_ / 8;
    for (size_t y = 0; y < height_; y++) {
        for (size_t bx = 0; bx < bpr; bx++) {
            uint8_t b0 = p0[y * bpr + bx];
            uint8_t b1 = p1[y * bpr + bx];
            for (int bit = 7; bit >= 0; bit--) {
                size_t index = ((b0 >> bit) & 0x01) | (((b1 >> bit) & 0x01) << 1);
                frame.pixels.push_back(palette_[index]);
            }
        }
    }
    return frame;
}
