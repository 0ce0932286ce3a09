// src/cpu/chip8.hpp
#pragma once
#include <array>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include "../AudioPatternPort.hpp"
#include "../system/Timer.hpp"

// Forward declarations
class Bus;
class Display;

constexpr size_t   REGISTER_COUNT = 16;
constexpr size_t   STACK_DEPTH    = 16;
constexpr size_t   FLAG_SLOTS     = 16;     // Fx75 / Fx85 storage
constexpr uint8_t  VF             = 0x0F;
constexpr uint16_t OP_LONG_LOAD   = 0xF000; // F000 NNNN, the only 4-byte opcode

// Fatal engine fault.  The interpreter cannot continue past one of these.
class CpuError : public std::runtime_error {
public:
    enum class Kind { UnknownOpcode, StackOverflow, StackUnderflow };

    CpuError(Kind kind, uint16_t opcode, uint16_t pc);

    Kind     kind() const { return kind_; }
    uint16_t opcode() const { return opcode_; }
    uint16_t pc() const { return pc_; }

private:
    Kind     kind_;
    uint16_t opcode_;
    uint16_t pc_;

    static std::string describe(Kind kind, uint16_t opcode, uint16_t pc);
};

// One decoded instruction word: the four nibbles plus the usual immediates.
struct Opcode {
    uint16_t word;
    uint8_t  n0, n1, n2, n3;
    uint8_t  x, y;      // register indices (n1, n2)
    uint8_t  kk;        // low byte
    uint16_t nnn;       // low 12 bits

    static Opcode decode(uint16_t word);
};

// CHIP-8 / SUPER-CHIP / XO-CHIP interpreter core.
//
// tick() executes one instruction.  It returns false only when the program
// sits in Fx0A without a fresh key press, in which case PC is unchanged.
class Chip8 {
public:
    Chip8(Bus& bus, Display& display, const Clock& clock = SteadyClock::instance());

    void reset();
    bool tick();

    uint16_t next_opcode() const;
    bool     exited() const { return exited_; }
    uint64_t get_cycles() const { return cycles_; }

    void set_audio_port(AudioPatternPort* port) { audio_ = port; }
    void seed_random(uint32_t seed) { rng_.seed(seed); }
    void set_timer_speed(double speed);

    // Debug access
    uint16_t get_pc() const { return reg.pc; }
    uint16_t get_i() const { return reg.i; }
    uint8_t  get_sp() const { return reg.sp; }
    uint8_t  get_v(uint8_t idx) const { return reg.v[idx & 0x0F]; }
    uint16_t get_stack(uint8_t idx) const { return reg.stack[idx % STACK_DEPTH]; }
    const Timer& delay_timer() const { return dt_; }
    const Timer& sound_timer() const { return st_; }
    const SoundPattern& sound_pattern() const { return sound_pattern_; }
    const std::array<uint8_t, FLAG_SLOTS>& get_flags() const { return flags_; }

    // Debug mutation (for test harnesses)
    void set_pc(uint16_t val) { reg.pc = val; }
    void set_i(uint16_t val) { reg.i = val; }
    void set_v(uint8_t idx, uint8_t val) { reg.v[idx & 0x0F] = val; }

    // One-line register dump, used by the scheduler at debug level 2.
    void print_state(FILE* out) const;

private:
    struct Registers {
        std::array<uint8_t, REGISTER_COUNT> v{};
        uint16_t i  = 0;
        uint16_t pc = 0;
        uint8_t  sp = 0;   // number of occupied stack entries
        std::array<uint16_t, STACK_DEPTH> stack{};
    } reg;

    Bus&     bus;
    Display& display;

    Timer dt_;
    Timer st_;
    SoundPattern sound_pattern_ = DEFAULT_SOUND_PATTERN;
    std::array<uint8_t, FLAG_SLOTS> flags_{};

    AudioPatternPort* audio_ = nullptr;
    std::mt19937      rng_{std::random_device{}()};

    bool     advance_ = true;    // cleared by opcodes that set PC themselves
    bool     waiting_ = false;   // Fx0A saw no new key press
    bool     exited_  = false;
    uint64_t cycles_  = 0;

    // Opcode table, indexed by the top nibble
    using OpcodeFunc = std::function<void(const Opcode&)>;
    std::array<OpcodeFunc, 16> main_table;

    // ------------------------------------------------------------------------
    // Internal Helpers
    // ------------------------------------------------------------------------
    void jump(uint16_t addr);
    void skip_if(bool cond);
    void push(uint16_t val, const Opcode& op);
    uint16_t pop(const Opcode& op);
    [[noreturn]] void unknown(const Opcode& op) const;

    // Grouped operations
    void op_system(const Opcode& op);
    void op_alu(const Opcode& op);
    void op_draw(const Opcode& op);
    void op_keys(const Opcode& op);
    void op_misc(const Opcode& op);
    void op_store_range(const Opcode& op);
    void op_load_range(const Opcode& op);
    void op_wait_key(const Opcode& op);
    void op_arm_sound(const Opcode& op);

    void init_main_table();
};
