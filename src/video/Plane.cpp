// src/video/Plane.cpp
#include "Plane.hpp"
#include <algorithm>
#include <array>

Plane::Plane(size_t width, size_t height)
    : width_(width), height_(height), cells_(width / 8 * height, 0x00) {}

void Plane::clear() {
    std::fill(cells_.begin(), cells_.end(), 0x00);
}

bool Plane::pixel(size_t x, size_t y) const {
    if (x >= width_ || y >= height_) return false;
    return (cells_[y * bytes_per_row() + x / 8] >> (7 - x % 8)) & 0x01;
}

// ============================================================================
// UNALIGNED BYTE ACCESS
// ============================================================================
// The 8-pixel window starting at x is assembled from the byte holding x and
// the byte to its right (wrapping to column 0 at the row end).
uint8_t Plane::get_byte(unsigned x, unsigned y) const {
    size_t bpr       = bytes_per_row();
    size_t offs_byte = x / 8;
    size_t offs_bits = x % 8;
    size_t line      = y * bpr;

    uint16_t word = (cells_[line + offs_byte] << 8) |
                     cells_[line + (offs_byte + 1) % bpr];
    return static_cast<uint8_t>((word >> (8 - offs_bits)) & 0xFF);
}

void Plane::set_byte(unsigned x, unsigned y, uint8_t val) {
    size_t bpr       = bytes_per_row();
    size_t offs_byte = x / 8;
    size_t offs_bits = x % 8;
    size_t line      = y * bpr;
    size_t next      = line + (offs_byte + 1) % bpr;

    uint16_t word = (cells_[line + offs_byte] << 8) | cells_[next];
    word &= static_cast<uint16_t>(~(0xFF << (8 - offs_bits)));
    word |= static_cast<uint16_t>(val << (8 - offs_bits));
    cells_[line + offs_byte] = static_cast<uint8_t>(word >> 8);
    cells_[next]             = static_cast<uint8_t>(word & 0xFF);
}

// ============================================================================
// SPRITES
// ============================================================================
bool Plane::write_sprite(const uint8_t* rows, size_t count, unsigned x, unsigned y) {
    bool collision = false;
    x %= width_;
    y %= height_;
    for (size_t i = 0; i < count; i++) {
        unsigned row     = static_cast<unsigned>((y + i) % height_);
        uint8_t  cur_val = get_byte(x, row);
        // A collision is a lit pixel hit by a lit sprite bit.
        if (cur_val & rows[i]) collision = true;
        set_byte(x, row, cur_val ^ rows[i]);
    }
    return collision;
}

bool Plane::write_sprite16(const uint8_t* rows, unsigned x, unsigned y) {
    std::array<uint8_t, 16> left{};
    std::array<uint8_t, 16> right{};
    for (size_t i = 0; i < 16; i++) {
        left[i]  = rows[i * 2];
        right[i] = rows[i * 2 + 1];
    }
    x %= width_;
    bool collision = write_sprite(left.data(), left.size(), x, y);
    collision |= write_sprite(right.data(), right.size(),
                              static_cast<unsigned>((x + 8) % width_), y);
    return collision;
}

// ============================================================================
// SCROLLING
// ============================================================================
void Plane::scroll_down(unsigned rows) {
    size_t shift = std::min<size_t>(rows, height_) * bytes_per_row();
    std::rotate(cells_.rbegin(), cells_.rbegin() + shift, cells_.rend());
    std::fill(cells_.begin(), cells_.begin() + shift, 0x00);
}

void Plane::scroll_up(unsigned rows) {
    size_t shift = std::min<size_t>(rows, height_) * bytes_per_row();
    std::rotate(cells_.begin(), cells_.begin() + shift, cells_.end());
    std::fill(cells_.end() - shift, cells_.end(), 0x00);
}

// Horizontal scrolls move whole nibbles; the nibble leaving one byte enters
// its neighbour and the vacated edge of each row is zero filled.
void Plane::scroll_right() {
    size_t bpr = bytes_per_row();
    for (size_t y = 0; y < height_; y++) {
        uint8_t carry = 0;
        for (size_t i = 0; i < bpr; i++) {
            uint8_t& val = cells_[y * bpr + i];
            uint8_t  out = val & 0x0F;
            val   = static_cast<uint8_t>((val >> 4) | (carry << 4));
            carry = out;
        }
    }
}

void Plane::scroll_left() {
    size_t bpr = bytes_per_row();
    for (size_t y = 0; y < height_; y++) {
        uint8_t carry = 0;
        for (size_t i = bpr; i-- > 0;) {
            uint8_t& val = cells_[y * bpr + i];
            uint8_t  out = (val & 0xF0) >> 4;
            val   = static_cast<uint8_t>((val << 4) | carry);
            carry = out;
        }
    }
}
