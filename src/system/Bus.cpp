// src/system/Bus.cpp
#include "Bus.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>

// 4×5 hex digits 0-F
static constexpr uint8_t FONT_SMALL[80] = {
    0xF0, 0x90, 0x90, 0x90, 0xF0,  // 0
    0x20, 0x60, 0x20, 0x20, 0x70,  // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0,  // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0,  // 3
    0x90, 0x90, 0xF0, 0x10, 0x10,  // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0,  // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0,  // 6
    0xF0, 0x10, 0x20, 0x40, 0x40,  // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0,  // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0,  // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90,  // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0,  // B
    0xF0, 0x80, 0x80, 0x80, 0xF0,  // C
    0xE0, 0x90, 0x90, 0x90, 0xE0,  // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0,  // E
    0xF0, 0x80, 0xF0, 0x80, 0x80,  // F
};

// 8×10 decimal digits 0-9
static constexpr uint8_t FONT_HIRES[100] = {
    0x3C, 0x7E, 0xE7, 0xC3, 0xC3, 0xC3, 0xC3, 0xE7, 0x7E, 0x3C,  // 0
    0x18, 0x38, 0x58, 0x18, 0x18, 0x18, 0x18, 0x18, 0x18, 0x3C,  // 1
    0x3E, 0x7F, 0xC3, 0x06, 0x0C, 0x18, 0x30, 0x60, 0xFF, 0xFF,  // 2
    0x3C, 0x7E, 0xC3, 0x03, 0x0E, 0x0E, 0x03, 0xC3, 0x7E, 0x3C,  // 3
    0x06, 0x0E, 0x1E, 0x36, 0x66, 0xC6, 0xFF, 0xFF, 0x06, 0x06,  // 4
    0xFF, 0xFF, 0xC0, 0xC0, 0xFC, 0xFE, 0x03, 0xC3, 0x7E, 0x3C,  // 5
    0x3E, 0x7C, 0xC0, 0xC0, 0xFC, 0xFE, 0xC3, 0xC3, 0x7E, 0x3C,  // 6
    0xFF, 0xFF, 0x03, 0x06, 0x0C, 0x18, 0x30, 0x60, 0x60, 0x60,  // 7
    0x3C, 0x7E, 0xC3, 0xC3, 0x7E, 0x7E, 0xC3, 0xC3, 0x7E, 0x3C,  // 8
    0x3C, 0x7E, 0xC3, 0xC3, 0x7F, 0x3F, 0x03, 0x03, 0x3E, 0x7C,  // 9
};

static_assert(FONT_START + sizeof(FONT_SMALL) <= FONT_HIRES_START,
              "font tables overlap");
static_assert(FONT_HIRES_START + sizeof(FONT_HIRES) <= PROGRAM_START,
              "font tables run into program area");

Bus::Bus() {
    reset();
}

void Bus::reset() {
    memory.fill(0x00);
    keys.fill(false);
    prev_keys.fill(false);
    load_fonts();
}

void Bus::load_fonts() {
    std::copy(std::begin(FONT_SMALL), std::end(FONT_SMALL),
              memory.begin() + FONT_START);
    std::copy(std::begin(FONT_HIRES), std::end(FONT_HIRES),
              memory.begin() + FONT_HIRES_START);
}

void Bus::load_program(const std::vector<uint8_t>& code) {
    if (code.empty()) {
        throw RomError("Program image is empty");
    }
    if (code.size() > PROGRAM_MAX_SIZE) {
        throw RomError("Program too large for memory map (" +
                       std::to_string(code.size()) + " bytes, max " +
                       std::to_string(PROGRAM_MAX_SIZE) + ")");
    }
    std::copy(code.begin(), code.end(), memory.begin() + PROGRAM_START);
}

void Bus::load_rom(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw RomError("Failed to open ROM file: " + path);
    }
    std::vector<uint8_t> code((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    load_program(code);
    std::cout << "[ROM] Loaded " << path << " (" << code.size() << " bytes)\n";
}
