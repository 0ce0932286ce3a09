// src/video/Plane.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// One monochrome bit layer of the display.
//
// Pixels are packed 8 per byte, MSB = leftmost, rows stored top to bottom.
// Width is always a multiple of 8.  A sprite byte placed at an x that is not
// byte aligned straddles two storage bytes; the second of those wraps to the
// start of the same row when x lies in the last byte column.
class Plane {
public:
    Plane(size_t width, size_t height);

    size_t width() const  { return width_; }
    size_t height() const { return height_; }
    size_t bytes_per_row() const { return width_ / 8; }

    void clear();

    // XOR sprite rows onto the plane at (x mod width, y mod height), one
    // byte per row, wrapping vertically row by row.  Returns true if any
    // set pixel was turned off.
    bool write_sprite(const uint8_t* rows, size_t count, unsigned x, unsigned y);

    // 16×16 form: 32 bytes, two per row (left half then right half).
    bool write_sprite16(const uint8_t* rows, unsigned x, unsigned y);

    void scroll_down(unsigned rows);
    void scroll_up(unsigned rows);
    void scroll_right();   // 4 pixels
    void scroll_left();    // 4 pixels

    bool pixel(size_t x, size_t y) const;
    const std::vector<uint8_t>& cells() const { return cells_; }

private:
    size_t width_;
    size_t height_;
    std::vector<uint8_t> cells_;

    uint8_t get_byte(unsigned x, unsigned y) const;
    void    set_byte(unsigned x, unsigned y, uint8_t val);
};
