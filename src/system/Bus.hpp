// src/system/Bus.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ============================================================================
// CHIP-8 MEMORY MAP
// ============================================================================
// 0x0000 - 0x004F : 5-byte small font, digits 0-F
// 0x0050 - 0x00B3 : 10-byte high-resolution font, digits 0-9 (SUPER-CHIP)
// 0x00B4 - 0x01FF : unused (interpreter area on original hardware)
// 0x0200 - 0xFFFF : program and data (XO-CHIP extends past 4KB via F000 NNNN)
// ============================================================================

constexpr size_t   MEMORY_SIZE      = 0x10000;
constexpr uint16_t FONT_START       = 0x0000;
constexpr size_t   FONT_SMALL_BYTES = 5;
constexpr uint16_t FONT_HIRES_START = 0x0050;
constexpr size_t   FONT_HIRES_BYTES = 10;
constexpr uint16_t PROGRAM_START    = 0x0200;
constexpr size_t   PROGRAM_MAX_SIZE = MEMORY_SIZE - PROGRAM_START;

constexpr size_t KEY_COUNT = 16;

using KeyState = std::array<bool, KEY_COUNT>;

// Program image could not be loaded.
class RomError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Memory and keypad.  Written only by the engine thread once running; the
// frontend's key snapshots reach it through the scheduler.
class Bus {
public:
    Bus();

    void reset();

    // Copy a raw program image to 0x200.  Throws RomError if it is empty or
    // does not fit below 0x10000.
    void load_program(const std::vector<uint8_t>& code);
    void load_rom(const std::string& path);

    uint8_t  read(uint16_t addr) const { return memory[addr]; }
    uint16_t read16(uint16_t addr) const {
        return static_cast<uint16_t>((memory[addr] << 8) |
                                      memory[static_cast<uint16_t>(addr + 1)]);
    }
    void write(uint16_t addr, uint8_t val) { memory[addr] = val; }

    // Keypad: current physical state and the snapshot taken by the last
    // wait-for-key instruction.
    void set_keys(const KeyState& k) { keys = k; }
    const KeyState& get_keys() const { return keys; }
    const KeyState& get_prev_keys() const { return prev_keys; }
    void latch_keys() { prev_keys = keys; }

    const std::array<uint8_t, MEMORY_SIZE>& get_memory() const { return memory; }

private:
    std::array<uint8_t, MEMORY_SIZE> memory{};
    KeyState keys{};
    KeyState prev_keys{};

    void load_fonts();
};
