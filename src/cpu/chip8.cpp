// src/cpu/chip8.cpp
#include "chip8.hpp"
#include "../system/Bus.hpp"
#include "../video/Display.hpp"
#include <cstdio>

// ============================================================================
// ERRORS AND DECODING
// ============================================================================
CpuError::CpuError(Kind kind, uint16_t opcode, uint16_t pc)
    : std::runtime_error(describe(kind, opcode, pc)),
      kind_(kind), opcode_(opcode), pc_(pc) {}

std::string CpuError::describe(Kind kind, uint16_t opcode, uint16_t pc) {
    const char* what = "unknown opcode";
    if (kind == Kind::StackOverflow)  what = "stack overflow";
    if (kind == Kind::StackUnderflow) what = "stack underflow";
    char buf[64];
    snprintf(buf, sizeof(buf), "%s 0x%04X at PC=0x%04X", what, opcode, pc);
    return buf;
}

Opcode Opcode::decode(uint16_t word) {
    Opcode op;
    op.word = word;
    op.n0   = (word >> 12) & 0x0F;
    op.n1   = (word >> 8) & 0x0F;
    op.n2   = (word >> 4) & 0x0F;
    op.n3   = word & 0x0F;
    op.x    = op.n1;
    op.y    = op.n2;
    op.kk   = word & 0xFF;
    op.nnn  = word & 0x0FFF;
    return op;
}

Chip8::Chip8(Bus& b, Display& d, const Clock& clock)
    : bus(b), display(d), dt_(clock), st_(clock) {
    init_main_table();
    reset();
}

void Chip8::reset() {
    reg = {};
    reg.pc = PROGRAM_START;
    dt_.set(0);
    st_.set(0);
    sound_pattern_ = DEFAULT_SOUND_PATTERN;
    flags_.fill(0x00);
    advance_ = true;
    waiting_ = false;
    exited_  = false;
    cycles_  = 0;
}

void Chip8::set_timer_speed(double speed) {
    dt_.set_speed(speed);
    st_.set_speed(speed);
}

uint16_t Chip8::next_opcode() const {
    return bus.read16(reg.pc);
}

// ============================================================================
// MAIN EXECUTION STEP
// ============================================================================
bool Chip8::tick() {
    if (exited_) return false;

    Opcode op = Opcode::decode(next_opcode());
    advance_ = true;
    waiting_ = false;

    main_table[op.n0](op);

    if (advance_) reg.pc += 2;
    cycles_++;
    return !waiting_;
}

// ============================================================================
// FLOW HELPERS
// ============================================================================
void Chip8::jump(uint16_t addr) {
    reg.pc   = addr;
    advance_ = false;
}

// Skips step over the next instruction, which is two words long when it is
// F000 NNNN.  The default increment then moves past the skipping opcode.
void Chip8::skip_if(bool cond) {
    if (!cond) return;
    reg.pc += 2;
    if (next_opcode() == OP_LONG_LOAD) reg.pc += 2;
}

void Chip8::push(uint16_t val, const Opcode& op) {
    if (reg.sp >= STACK_DEPTH)
        throw CpuError(CpuError::Kind::StackOverflow, op.word, reg.pc);
    reg.stack[reg.sp++] = val;
}

uint16_t Chip8::pop(const Opcode& op) {
    if (reg.sp == 0)
        throw CpuError(CpuError::Kind::StackUnderflow, op.word, reg.pc);
    return reg.stack[--reg.sp];
}

void Chip8::unknown(const Opcode& op) const {
    throw CpuError(CpuError::Kind::UnknownOpcode, op.word, reg.pc);
}

// ============================================================================
// 0x0--- : SYSTEM (clear, return, scroll, mode, exit)
// ============================================================================
void Chip8::op_system(const Opcode& op) {
    if (op.n1 != 0x0) unknown(op);                       // 0NNN  machine call
    if (op.n2 == 0xC) {                                  // 00CN  SCD N
        display.scroll(ScrollDirection::DOWN, op.n3);
        return;
    }
    if (op.n2 == 0xD) {                                  // 00DN  SCU N
        display.scroll(ScrollDirection::UP, op.n3);
        return;
    }
    if (op.n2 == 0xE && op.n3 == 0x0) {                  // 00E0  CLS
        display.clear();
        return;
    }
    if (op.n2 == 0xE && op.n3 == 0xE) {                  // 00EE  RET
        // Resumes at the CALL itself; the default increment moves past it.
        reg.pc = pop(op);
        return;
    }
    if (op.n2 == 0xF) {
        switch (op.n3) {
            case 0xB: display.scroll(ScrollDirection::RIGHT, 4); return;  // 00FB
            case 0xC: display.scroll(ScrollDirection::LEFT, 4);  return;  // 00FC
            case 0xD:                                                      // 00FD  EXIT
                exited_  = true;
                advance_ = false;
                return;
            case 0xE: display.set_extended(false); return;                // 00FE  LOW
            case 0xF: display.set_extended(true);  return;                // 00FF  HIGH
            default: break;
        }
    }
    unknown(op);
}

// ============================================================================
// 0x8--- : REGISTER ARITHMETIC
// ============================================================================
// VF is written after the result so that it holds the flag even when x == F.
void Chip8::op_alu(const Opcode& op) {
    uint8_t& vx = reg.v[op.x];
    uint8_t  vy = reg.v[op.y];
    switch (op.n3) {
        case 0x0: vx = vy;  break;                       // 8XY0  LD
        case 0x1: vx |= vy; break;                       // 8XY1  OR
        case 0x2: vx &= vy; break;                       // 8XY2  AND
        case 0x3: vx ^= vy; break;                       // 8XY3  XOR
        case 0x4: {                                      // 8XY4  ADD
            uint16_t res = vx + vy;
            vx = res & 0xFF;
            reg.v[VF] = res > 0xFF ? 1 : 0;
            break;
        }
        case 0x5: {                                      // 8XY5  SUB
            uint8_t no_borrow = vx >= vy ? 1 : 0;
            vx = static_cast<uint8_t>(vx - vy);
            reg.v[VF] = no_borrow;
            break;
        }
        case 0x6: {                                      // 8XY6  SHR (shifts Vy)
            uint8_t out = vy & 0x01;
            vx = vy >> 1;
            reg.v[VF] = out;
            break;
        }
        case 0x7: {                                      // 8XY7  SUBN
            uint8_t no_borrow = vy >= vx ? 1 : 0;
            vx = static_cast<uint8_t>(vy - vx);
            reg.v[VF] = no_borrow;
            break;
        }
        case 0xE: {                                      // 8XYE  SHL (shifts Vy)
            uint8_t out = (vy >> 7) & 0x01;
            vx = static_cast<uint8_t>(vy << 1);
            reg.v[VF] = out;
            break;
        }
        default: unknown(op);
    }
}

// ============================================================================
// 0xD--- : DRAW
// ============================================================================
void Chip8::op_draw(const Opcode& op) {
    bool   both      = display.active_planes() == 0x03;
    bool   big       = op.n3 == 0;
    size_t per_plane = big ? 32 : op.n3;
    size_t count     = both ? per_plane * 2 : per_plane;

    std::array<uint8_t, 64> sprite{};
    for (size_t k = 0; k < count; k++)
        sprite[k] = bus.read(static_cast<uint16_t>(reg.i + k));

    unsigned x = reg.v[op.x];
    unsigned y = reg.v[op.y];
    bool collision = big ? display.write_sprite16(sprite.data(), count, x, y)
                         : display.write_sprite(sprite.data(), count, x, y);
    reg.v[VF] = collision ? 1 : 0;
}

// ============================================================================
// 0xE--- : KEYPAD SKIPS
// ============================================================================
void Chip8::op_keys(const Opcode& op) {
    bool down = bus.get_keys()[reg.v[op.x] & 0x0F];
    if (op.kk == 0x9E)      skip_if(down);               // EX9E  SKP
    else if (op.kk == 0xA1) skip_if(!down);              // EXA1  SKNP
    else unknown(op);
}

// ============================================================================
// 0x5--- RANGE TRANSFERS (XO-CHIP)
// ============================================================================
// Registers x..y inclusive, in descending order when x > y.
void Chip8::op_store_range(const Opcode& op) {
    int dist = op.x <= op.y ? op.y - op.x : op.x - op.y;
    int step = op.x <= op.y ? 1 : -1;
    for (int k = 0; k <= dist; k++)
        bus.write(static_cast<uint16_t>(reg.i + k), reg.v[op.x + k * step]);
}

void Chip8::op_load_range(const Opcode& op) {
    int dist = op.x <= op.y ? op.y - op.x : op.x - op.y;
    int step = op.x <= op.y ? 1 : -1;
    for (int k = 0; k <= dist; k++)
        reg.v[op.x + k * step] = bus.read(static_cast<uint16_t>(reg.i + k));
}

// ============================================================================
// 0xF--- : TIMERS, KEYS, MEMORY
// ============================================================================
// Only a key that was up at the previous Fx0A poll counts as a press, so a
// key held down is reported once.
void Chip8::op_wait_key(const Opcode& op) {
    const KeyState& keys = bus.get_keys();
    const KeyState& prev = bus.get_prev_keys();
    bool pressed = false;
    for (size_t k = 0; k < KEY_COUNT; k++) {
        if (keys[k]) {
            if (!prev[k]) {
                reg.v[op.x] = static_cast<uint8_t>(k);
                pressed = true;
            }
            break;
        }
    }
    bus.latch_keys();
    if (!pressed) {
        advance_ = false;
        waiting_ = true;
    }
}

void Chip8::op_arm_sound(const Opcode& op) {
    st_.set(reg.v[op.x]);
    if (audio_ == nullptr) return;
    if (auto remaining = st_.time_remaining())
        audio_->on_arm(sound_pattern_, *remaining);
}

void Chip8::op_misc(const Opcode& op) {
    if (op.word == OP_LONG_LOAD) {                       // F000 NNNN
        reg.pc += 2;
        reg.i = bus.read16(reg.pc);
        return;
    }
    if (op.word == 0xF002) {                             // F002  audio pattern
        for (size_t k = 0; k < sound_pattern_.size(); k++)
            sound_pattern_[k] = bus.read(static_cast<uint16_t>(reg.i + k));
        return;
    }
    if (op.kk == 0x01) {                                 // FN01  plane mask
        display.set_active_planes(op.n1);
        return;
    }

    uint8_t& vx = reg.v[op.x];
    switch (op.kk) {
        case 0x07: vx = dt_.get(); break;                // FX07
        case 0x0A: op_wait_key(op); break;               // FX0A
        case 0x15: dt_.set(vx); break;                   // FX15
        case 0x18: op_arm_sound(op); break;              // FX18
        case 0x1E: reg.i = static_cast<uint16_t>(reg.i + vx); break;  // FX1E
        case 0x29:                                       // FX29  small digit
            reg.i = static_cast<uint16_t>(FONT_START + vx * FONT_SMALL_BYTES);
            break;
        case 0x30:                                       // FX30  big digit
            reg.i = static_cast<uint16_t>(FONT_HIRES_START + vx * FONT_HIRES_BYTES);
            break;
        case 0x33:                                       // FX33  BCD
            bus.write(reg.i, vx / 100);
            bus.write(static_cast<uint16_t>(reg.i + 1), (vx / 10) % 10);
            bus.write(static_cast<uint16_t>(reg.i + 2), vx % 10);
            break;
        case 0x55:                                       // FX55  (I unchanged)
            for (int k = 0; k <= op.x; k++)
                bus.write(static_cast<uint16_t>(reg.i + k), reg.v[k]);
            break;
        case 0x65:                                       // FX65  (I unchanged)
            for (int k = 0; k <= op.x; k++)
                reg.v[k] = bus.read(static_cast<uint16_t>(reg.i + k));
            break;
        case 0x75:                                       // FX75  save flags
            for (int k = 0; k <= op.x; k++) flags_[k] = reg.v[k];
            break;
        case 0x85:                                       // FX85  load flags
            for (int k = 0; k <= op.x; k++) reg.v[k] = flags_[k];
            break;
        default: unknown(op);
    }
}

// ============================================================================
// OPCODE TABLE
// ============================================================================
void Chip8::init_main_table() {
    main_table[0x0] = [this](const Opcode& op) { op_system(op); };
    main_table[0x1] = [this](const Opcode& op) { jump(op.nnn); };          // 1NNN  JP
    main_table[0x2] = [this](const Opcode& op) {                          // 2NNN  CALL
        push(reg.pc, op);
        jump(op.nnn);
    };
    main_table[0x3] = [this](const Opcode& op) { skip_if(reg.v[op.x] == op.kk); };
    main_table[0x4] = [this](const Opcode& op) { skip_if(reg.v[op.x] != op.kk); };
    main_table[0x5] = [this](const Opcode& op) {
        switch (op.n3) {
            case 0x0: skip_if(reg.v[op.x] == reg.v[op.y]); break;         // 5XY0
            case 0x2: op_store_range(op); break;                          // 5XY2
            case 0x3: op_load_range(op); break;                           // 5XY3
            default: unknown(op);
        }
    };
    main_table[0x6] = [this](const Opcode& op) { reg.v[op.x] = op.kk; };
    main_table[0x7] = [this](const Opcode& op) {                          // 7XKK  no flag
        reg.v[op.x] = static_cast<uint8_t>(reg.v[op.x] + op.kk);
    };
    main_table[0x8] = [this](const Opcode& op) { op_alu(op); };
    main_table[0x9] = [this](const Opcode& op) {
        if (op.n3 != 0x0) unknown(op);
        skip_if(reg.v[op.x] != reg.v[op.y]);                              // 9XY0
    };
    main_table[0xA] = [this](const Opcode& op) { reg.i = op.nnn; };
    // BNNN always offsets by V0, whatever the X nibble says.
    main_table[0xB] = [this](const Opcode& op) {
        jump(static_cast<uint16_t>(op.nnn + reg.v[0]));
    };
    main_table[0xC] = [this](const Opcode& op) {                          // CXKK  RND
        std::uniform_int_distribution<int> byte(0, 255);
        reg.v[op.x] = static_cast<uint8_t>(byte(rng_)) & op.kk;
    };
    main_table[0xD] = [this](const Opcode& op) { op_draw(op); };
    main_table[0xE] = [this](const Opcode& op) { op_keys(op); };
    main_table[0xF] = [this](const Opcode& op) { op_misc(op); };
}

// ============================================================================
// DEBUG
// ============================================================================
void Chip8::print_state(FILE* out) const {
    fprintf(out, "PC=%04X I=%04X SP=%u DT=%3u ST=%3u V=",
            reg.pc, reg.i, (unsigned)reg.sp, (unsigned)dt_.get(), (unsigned)st_.get());
    for (size_t k = 0; k < REGISTER_COUNT; k++)
        fprintf(out, "%02X%s", reg.v[k], k + 1 < REGISTER_COUNT ? " " : "");
    fprintf(out, "  next=%04X\n", next_opcode());
}
