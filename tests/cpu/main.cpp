// tests/cpu/main.cpp
// Instruction-level checks for the interpreter core.
//
// Each case loads a short program at 0x200 into a fresh machine driven by a
// hand-advanced clock, ticks it and inspects registers, memory and display.
//
// Usage: cpu_test

#include <cstdio>
#include <array>
#include <cstdint>
#include <fstream>
#include <vector>
#include "../../src/cpu/chip8.hpp"
#include "../../src/system/Bus.hpp"
#include "../../src/video/Display.hpp"
#include "../../src/Debugger.hpp"
#include "../common/check.hpp"
#include "../common/fake_clock.hpp"

using namespace std::chrono_literals;

struct Machine {
    FakeClock clock;
    Bus       bus;
    Display   display;
    Chip8     cpu{bus, display, clock};

    explicit Machine(const std::vector<uint8_t>& code) {
        bus.load_program(code);
    }

    void run(int n) {
        for (int k = 0; k < n; k++) cpu.tick();
    }
};

// Records every sound request the interpreter makes.
class RecordingPort : public AudioPatternPort {
public:
    int                      calls = 0;
    SoundPattern             pattern{};
    std::chrono::nanoseconds duration{0};

    void on_arm(const SoundPattern& p, std::chrono::nanoseconds d) override {
        calls++;
        pattern  = p;
        duration = d;
    }
};

static CpuError::Kind expect_fault(Machine& m, bool& thrown, uint16_t& opcode, uint16_t& pc) {
    thrown = false;
    try {
        m.cpu.tick();
    } catch (const CpuError& e) {
        thrown = true;
        opcode = e.opcode();
        pc     = e.pc();
        return e.kind();
    }
    return CpuError::Kind::UnknownOpcode;
}

// ============================================================================
// LOAD / FLOW
// ============================================================================
static void test_load_and_add() {
    Machine m({0x60, 0x03, 0x70, 0x05});   // LD V0,3 ; ADD V0,5
    m.run(2);
    CHECK_EQ(m.cpu.get_v(0), 8);
    CHECK_EQ(m.cpu.get_pc(), 0x204);
    CHECK_EQ(m.cpu.get_sp(), 0);
    CHECK_EQ(m.cpu.get_cycles(), 2);
}

static void test_add_immediate_leaves_flag() {
    Machine m({0x6F, 0x07, 0x60, 0xFF, 0x70, 0x02});
    m.run(3);
    CHECK_EQ(m.cpu.get_v(0), 0x01);
    CHECK_EQ(m.cpu.get_v(VF), 0x07);
}

static void test_call_and_return() {
    std::vector<uint8_t> code(0x200, 0x00);
    code[0x000] = 0x23; code[0x001] = 0x00;   // 0x200: CALL 0x300
    code[0x100] = 0x00; code[0x101] = 0xEE;   // 0x300: RET
    Machine m(code);

    m.cpu.tick();
    CHECK_EQ(m.cpu.get_pc(), 0x300);
    CHECK_EQ(m.cpu.get_sp(), 1);
    CHECK_EQ(m.cpu.get_stack(0), 0x200);

    m.cpu.tick();
    CHECK_EQ(m.cpu.get_pc(), 0x202);
    CHECK_EQ(m.cpu.get_sp(), 0);
}

static void test_jump_and_offset_jump() {
    Machine m({0x12, 0x08});
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_pc(), 0x208);

    // BXNN still offsets by V0, not VX.
    Machine b({0xB3, 0x10});
    b.cpu.set_v(0, 0x04);
    b.cpu.set_v(3, 0x40);
    b.cpu.tick();
    CHECK_EQ(b.cpu.get_pc(), 0x314);
}

static void test_skips() {
    {
        Machine m({0x30, 0x05});
        m.cpu.set_v(0, 5);
        m.cpu.tick();
        CHECK_EQ(m.cpu.get_pc(), 0x204);
    }
    {
        Machine m({0x30, 0x05});
        m.cpu.set_v(0, 4);
        m.cpu.tick();
        CHECK_EQ(m.cpu.get_pc(), 0x202);
    }
    {
        // A taken skip steps over the whole of F000 NNNN.
        Machine m({0x30, 0x05, 0xF0, 0x00, 0x12, 0x34});
        m.cpu.set_v(0, 5);
        m.cpu.tick();
        CHECK_EQ(m.cpu.get_pc(), 0x206);
    }
    {
        Machine m({0x40, 0x05, 0xF0, 0x00, 0x12, 0x34});
        m.cpu.set_v(0, 5);
        m.cpu.tick();
        CHECK_EQ(m.cpu.get_pc(), 0x202);
    }
    {
        Machine m({0x51, 0x20, 0x00, 0x00, 0x91, 0x20});
        m.cpu.set_v(1, 9);
        m.cpu.set_v(2, 9);
        m.cpu.tick();
        CHECK_EQ(m.cpu.get_pc(), 0x204);
        m.cpu.tick();
        CHECK_EQ(m.cpu.get_pc(), 0x206);
    }
    {
        Machine m({0xE3, 0x9E, 0x00, 0x00, 0xE3, 0xA1});
        m.cpu.set_v(3, 0xA);
        KeyState keys{};
        keys[0xA] = true;
        m.bus.set_keys(keys);
        m.cpu.tick();
        CHECK_EQ(m.cpu.get_pc(), 0x204);
        m.cpu.tick();
        CHECK_EQ(m.cpu.get_pc(), 0x206);
    }
}

static void test_long_load() {
    Machine m({0xF0, 0x00, 0x12, 0x34, 0x60, 0x01});
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_i(), 0x1234);
    CHECK_EQ(m.cpu.get_pc(), 0x204);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(0), 1);
}

static void test_exit() {
    Machine m({0x00, 0xFD});
    CHECK(!m.cpu.exited());
    m.cpu.tick();
    CHECK(m.cpu.exited());
    CHECK_EQ(m.cpu.get_pc(), 0x200);
    CHECK(!m.cpu.tick());
    CHECK_EQ(m.cpu.get_cycles(), 1);
}

// ============================================================================
// ARITHMETIC
// ============================================================================
static void test_add_flag_sweep() {
    Machine m({0x80, 0x14});
    for (int a = 0; a < 256; a += 3) {
        for (int b = 0; b < 256; b += 5) {
            m.cpu.set_pc(0x200);
            m.cpu.set_v(0, static_cast<uint8_t>(a));
            m.cpu.set_v(1, static_cast<uint8_t>(b));
            m.cpu.tick();
            CHECK_EQ(m.cpu.get_v(0), (a + b) & 0xFF);
            CHECK_EQ(m.cpu.get_v(VF), a + b > 0xFF ? 1 : 0);
        }
    }
}

static void test_sub_flag_sweep() {
    Machine sub({0x80, 0x15});
    Machine subn({0x80, 0x17});
    for (int a = 0; a < 256; a += 7) {
        for (int b = 0; b < 256; b += 3) {
            sub.cpu.set_pc(0x200);
            sub.cpu.set_v(0, static_cast<uint8_t>(a));
            sub.cpu.set_v(1, static_cast<uint8_t>(b));
            sub.cpu.tick();
            CHECK_EQ(sub.cpu.get_v(0), (a - b) & 0xFF);
            CHECK_EQ(sub.cpu.get_v(VF), a >= b ? 1 : 0);

            subn.cpu.set_pc(0x200);
            subn.cpu.set_v(0, static_cast<uint8_t>(a));
            subn.cpu.set_v(1, static_cast<uint8_t>(b));
            subn.cpu.tick();
            CHECK_EQ(subn.cpu.get_v(0), (b - a) & 0xFF);
            CHECK_EQ(subn.cpu.get_v(VF), b >= a ? 1 : 0);
        }
    }
}

static void test_flag_register_as_operand() {
    // With X = F the flag wins over the arithmetic result.
    Machine m({0x8F, 0x14});
    m.cpu.set_v(VF, 0xFF);
    m.cpu.set_v(1, 0x01);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(VF), 1);
}

static void test_logic() {
    Machine m({0x80, 0x11, 0x80, 0x12, 0x80, 0x13, 0x80, 0x10});
    m.cpu.set_v(0, 0x0C);
    m.cpu.set_v(1, 0x0A);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(0), 0x0E);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(0), 0x0A);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(0), 0x00);
    m.cpu.set_v(1, 0x5A);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(0), 0x5A);
}

static void test_shifts_use_vy() {
    Machine shr({0x80, 0x16});
    shr.cpu.set_v(0, 0xF0);
    shr.cpu.set_v(1, 0x03);
    shr.cpu.tick();
    CHECK_EQ(shr.cpu.get_v(0), 0x01);
    CHECK_EQ(shr.cpu.get_v(1), 0x03);
    CHECK_EQ(shr.cpu.get_v(VF), 1);

    Machine shl({0x80, 0x1E});
    shl.cpu.set_v(0, 0x00);
    shl.cpu.set_v(1, 0x81);
    shl.cpu.tick();
    CHECK_EQ(shl.cpu.get_v(0), 0x02);
    CHECK_EQ(shl.cpu.get_v(VF), 1);

    shl.cpu.set_pc(0x200);
    shl.cpu.set_v(1, 0x41);
    shl.cpu.tick();
    CHECK_EQ(shl.cpu.get_v(0), 0x82);
    CHECK_EQ(shl.cpu.get_v(VF), 0);
}

static void test_random_is_masked() {
    Machine m({0xC0, 0x00, 0xC1, 0x0F});
    m.cpu.seed_random(1234);
    m.cpu.set_v(0, 0xFF);
    m.run(2);
    CHECK_EQ(m.cpu.get_v(0), 0);
    CHECK(m.cpu.get_v(1) <= 0x0F);
}

// ============================================================================
// FAULTS
// ============================================================================
static void test_unknown_opcode() {
    const uint16_t bad[] = {0x0123, 0x800F, 0xE0FF, 0x5124, 0x9121, 0xF0FF};
    for (uint16_t word : bad) {
        Machine m({static_cast<uint8_t>(word >> 8), static_cast<uint8_t>(word & 0xFF)});
        bool thrown;
        uint16_t opcode = 0, pc = 0;
        CpuError::Kind kind = expect_fault(m, thrown, opcode, pc);
        CHECK(thrown);
        CHECK(kind == CpuError::Kind::UnknownOpcode);
        CHECK_EQ(opcode, word);
        CHECK_EQ(pc, 0x200);
    }
}

static void test_stack_limits() {
    Machine m({0x22, 0x00});   // CALL 0x200, forever
    for (size_t k = 0; k < STACK_DEPTH; k++) m.cpu.tick();
    CHECK_EQ(m.cpu.get_sp(), STACK_DEPTH);

    bool thrown;
    uint16_t opcode = 0, pc = 0;
    CpuError::Kind kind = expect_fault(m, thrown, opcode, pc);
    CHECK(thrown);
    CHECK(kind == CpuError::Kind::StackOverflow);
    CHECK_EQ(opcode, 0x2200);

    Machine r({0x00, 0xEE});
    kind = expect_fault(r, thrown, opcode, pc);
    CHECK(thrown);
    CHECK(kind == CpuError::Kind::StackUnderflow);
}

// ============================================================================
// KEYPAD
// ============================================================================
static void test_wait_for_key_edge() {
    Machine m({0xF3, 0x0A});
    KeyState keys{};

    CHECK(!m.cpu.tick());
    CHECK_EQ(m.cpu.get_pc(), 0x200);

    keys[5] = true;
    m.bus.set_keys(keys);
    CHECK(m.cpu.tick());
    CHECK_EQ(m.cpu.get_v(3), 5);
    CHECK_EQ(m.cpu.get_pc(), 0x202);

    // Still held: not a new press.
    m.cpu.set_pc(0x200);
    CHECK(!m.cpu.tick());
    CHECK_EQ(m.cpu.get_pc(), 0x200);

    keys[5] = false;
    m.bus.set_keys(keys);
    CHECK(!m.cpu.tick());

    keys[9] = true;
    m.bus.set_keys(keys);
    CHECK(m.cpu.tick());
    CHECK_EQ(m.cpu.get_v(3), 9);
}

// ============================================================================
// MEMORY
// ============================================================================
static void test_range_transfers() {
    Machine m({0x51, 0x32, 0x53, 0x12});
    m.cpu.set_v(1, 1);
    m.cpu.set_v(2, 2);
    m.cpu.set_v(3, 3);
    m.cpu.set_i(0x400);
    m.cpu.tick();
    CHECK_EQ(m.bus.read(0x400), 1);
    CHECK_EQ(m.bus.read(0x401), 2);
    CHECK_EQ(m.bus.read(0x402), 3);
    m.cpu.tick();
    CHECK_EQ(m.bus.read(0x400), 3);
    CHECK_EQ(m.bus.read(0x401), 2);
    CHECK_EQ(m.bus.read(0x402), 1);
    CHECK_EQ(m.cpu.get_i(), 0x400);

    Machine l({0x51, 0x33, 0x53, 0x13});
    l.bus.write(0x400, 9);
    l.bus.write(0x401, 8);
    l.bus.write(0x402, 7);
    l.cpu.set_i(0x400);
    l.cpu.tick();
    CHECK_EQ(l.cpu.get_v(1), 9);
    CHECK_EQ(l.cpu.get_v(2), 8);
    CHECK_EQ(l.cpu.get_v(3), 7);
    l.cpu.tick();
    CHECK_EQ(l.cpu.get_v(3), 9);
    CHECK_EQ(l.cpu.get_v(2), 8);
    CHECK_EQ(l.cpu.get_v(1), 7);
}

static void test_bcd_and_block_copy() {
    Machine m({0xF2, 0x33, 0xF2, 0x55, 0x60, 0x00, 0x61, 0x00, 0xF2, 0x65});
    m.cpu.set_v(0, 0x11);
    m.cpu.set_v(1, 0x22);
    m.cpu.set_v(2, 234);
    m.cpu.set_i(0x400);
    m.cpu.tick();
    CHECK_EQ(m.bus.read(0x400), 2);
    CHECK_EQ(m.bus.read(0x401), 3);
    CHECK_EQ(m.bus.read(0x402), 4);

    m.cpu.set_i(0x500);
    m.run(4);
    CHECK_EQ(m.cpu.get_i(), 0x500);
    CHECK_EQ(m.cpu.get_v(0), 0x11);
    CHECK_EQ(m.cpu.get_v(1), 0x22);
    CHECK_EQ(m.cpu.get_v(2), 234);
}

static void test_flag_slots() {
    Machine m({0xF3, 0x75, 0x60, 0x00, 0x63, 0x00, 0xF3, 0x85});
    for (uint8_t r = 0; r < 4; r++) m.cpu.set_v(r, static_cast<uint8_t>(0x10 + r));
    m.run(3);
    CHECK_EQ(m.cpu.get_v(0), 0);
    CHECK_EQ(m.cpu.get_flags()[3], 0x13);
    m.cpu.tick();
    for (uint8_t r = 0; r < 4; r++) CHECK_EQ(m.cpu.get_v(r), 0x10 + r);
}

static void test_font_addresses() {
    Machine m({0xF0, 0x29, 0xF1, 0x30});
    m.cpu.set_v(0, 0xA);
    m.cpu.set_v(1, 3);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_i(), 0x32);
    CHECK_EQ(m.bus.read(m.cpu.get_i()), 0xF0);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_i(), FONT_HIRES_START + 30);
    CHECK_EQ(m.bus.read(m.cpu.get_i()), 0x3C);
}

static void test_memory_map() {
    Bus bus;
    const std::array<uint8_t, MEMORY_SIZE>& mem = bus.get_memory();
    CHECK_EQ(mem[FONT_START], 0xF0);                              // '0'
    CHECK_EQ(mem[FONT_START + 0xF * FONT_SMALL_BYTES + 4], 0x80); // 'F' last row
    CHECK_EQ(mem[FONT_HIRES_START], 0x3C);                        // big '0'
    CHECK_EQ(mem[FONT_HIRES_START + 9 * FONT_HIRES_BYTES + 9], 0x7C);
    CHECK_EQ(mem[PROGRAM_START], 0x00);

    bus.load_program({0x12, 0x34, 0x56});
    CHECK_EQ(mem[PROGRAM_START], 0x12);
    CHECK_EQ(mem[PROGRAM_START + 2], 0x56);
    CHECK_EQ(mem[PROGRAM_START + 3], 0x00);
    CHECK_EQ(bus.read16(PROGRAM_START), 0x1234);

    // Word reads wrap at the top of memory.
    bus.write(0xFFFF, 0xAB);
    CHECK_EQ(bus.read16(0xFFFF), 0xABF0);

    bus.reset();
    CHECK_EQ(mem[PROGRAM_START], 0x00);
    CHECK_EQ(mem[FONT_START], 0xF0);
}

static void test_load_program_errors() {
    Bus bus;
    bool empty_threw = false;
    try {
        bus.load_program({});
    } catch (const RomError&) {
        empty_threw = true;
    }
    CHECK(empty_threw);

    bool big_threw = false;
    try {
        bus.load_program(std::vector<uint8_t>(PROGRAM_MAX_SIZE + 1, 0x00));
    } catch (const RomError&) {
        big_threw = true;
    }
    CHECK(big_threw);

    bool missing_threw = false;
    try {
        bus.load_rom("does/not/exist.ch8");
    } catch (const RomError&) {
        missing_threw = true;
    }
    CHECK(missing_threw);
}

// ============================================================================
// TIMERS AND SOUND
// ============================================================================
static void test_delay_timer() {
    Machine m({0x6A, 0x3C, 0xFA, 0x15, 0xFB, 0x07});
    m.run(3);
    CHECK_EQ(m.cpu.get_v(0xB), 60);

    m.clock.advance(500ms);
    m.cpu.set_pc(0x204);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(0xB), 30);

    m.clock.advance(2s);
    m.cpu.set_pc(0x204);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(0xB), 0);
}

static void test_sound_arms_port() {
    Machine m({0xA4, 0x00, 0xF0, 0x02, 0x6A, 0x3C, 0xFA, 0x18, 0x6B, 0x00, 0xFB, 0x18});
    RecordingPort port;
    m.cpu.set_audio_port(&port);
    for (uint16_t k = 0; k < 16; k++) m.bus.write(0x400 + k, static_cast<uint8_t>(k));

    m.run(4);
    CHECK_EQ(port.calls, 1);
    CHECK(port.duration == std::chrono::nanoseconds(1000000000));
    CHECK_EQ(port.pattern[15], 15);
    CHECK(m.cpu.sound_pattern() == port.pattern);
    CHECK_EQ(m.cpu.sound_timer().get(), 60);

    // Zero silences without a new request.
    m.run(2);
    CHECK_EQ(port.calls, 1);
    CHECK_EQ(m.cpu.sound_timer().get(), 0);
}

// ============================================================================
// DISPLAY OPCODES
// ============================================================================
static void test_draw_font_digit() {
    Machine m({0x60, 0x00, 0xF0, 0x29, 0xD0, 0x05, 0xD0, 0x05});
    m.run(3);
    CHECK_EQ(m.cpu.get_v(VF), 0);
    CHECK(m.display.plane(0).pixel(0, 0));
    CHECK(!m.display.plane(0).pixel(1, 1));
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(VF), 1);
    CHECK(!m.display.plane(0).pixel(0, 0));
}

static void test_mode_and_plane_opcodes() {
    Machine m({0xF3, 0x01, 0x00, 0xFF, 0x00, 0xE0, 0x00, 0xFE});
    m.cpu.tick();
    CHECK_EQ(m.display.active_planes(), 3);
    m.cpu.tick();
    CHECK(m.display.extended());
    CHECK_EQ(m.display.width(), CHIP8_EXT_WIDTH);
    CHECK_EQ(m.display.active_planes(), 3);
    m.run(2);
    CHECK(!m.display.extended());
    CHECK_EQ(m.display.height(), CHIP8_HEIGHT);
}

static void test_two_plane_draw_reads_both_halves() {
    Machine m({0xF3, 0x01, 0xA4, 0x00, 0xD0, 0x01});
    m.bus.write(0x400, 0x80);
    m.bus.write(0x401, 0x01);
    m.run(3);
    CHECK(m.display.plane(0).pixel(0, 0));
    CHECK(!m.display.plane(1).pixel(0, 0));
    CHECK(m.display.plane(1).pixel(7, 0));
}

static void test_scroll_and_clear_opcodes() {
    // SCD 2, SCU 1, SCR, SCL, CLS
    Machine m({0x00, 0xC2, 0x00, 0xD1, 0x00, 0xFB, 0x00, 0xFC, 0x00, 0xE0});
    const uint8_t dot = 0x80;
    m.display.write_sprite(&dot, 1, 8, 4);
    const Plane& p = m.display.plane(0);

    m.cpu.tick();
    CHECK(p.pixel(8, 6));
    CHECK(!p.pixel(8, 4));
    m.cpu.tick();
    CHECK(p.pixel(8, 5));
    CHECK(!p.pixel(8, 6));
    m.cpu.tick();
    CHECK(p.pixel(12, 5));
    CHECK(!p.pixel(8, 5));
    m.cpu.tick();
    CHECK(p.pixel(8, 5));
    CHECK(!p.pixel(12, 5));

    uint64_t before = m.display.updates();
    m.cpu.tick();
    CHECK(!p.pixel(8, 5));
    for (uint8_t b : p.cells()) CHECK_EQ(b, 0);
    CHECK_EQ(m.display.updates(), before + 1);
    CHECK_EQ(m.cpu.get_pc(), 0x20A);
}

static void fill_big_sprite(Machine& m, size_t bytes) {
    for (size_t k = 0; k < bytes; k++)
        m.bus.write(static_cast<uint16_t>(0x400 + k), static_cast<uint8_t>(k + 1));
}

static void test_big_sprite_one_plane() {
    Machine m({0xA4, 0x00, 0xD0, 0x10});
    fill_big_sprite(m, 64);
    m.run(2);
    CHECK_EQ(m.cpu.get_v(VF), 0);

    const size_t bpr = CHIP8_WIDTH / 8;
    const std::vector<uint8_t>& c0 = m.display.plane(0).cells();
    for (size_t row = 0; row < 16; row++) {
        CHECK_EQ(c0[row * bpr],     row * 2 + 1);
        CHECK_EQ(c0[row * bpr + 1], row * 2 + 2);
    }
    CHECK_EQ(c0[16 * bpr], 0);
    for (uint8_t b : m.display.plane(1).cells()) CHECK_EQ(b, 0);

    // Second draw erases and reports the collision.
    m.cpu.set_pc(0x202);
    m.cpu.tick();
    CHECK_EQ(m.cpu.get_v(VF), 1);
    for (uint8_t b : c0) CHECK_EQ(b, 0);
}

static void test_big_sprite_two_planes() {
    Machine m({0xF3, 0x01, 0xA4, 0x00, 0xD0, 0x10});
    fill_big_sprite(m, 64);
    m.run(3);

    const size_t bpr = CHIP8_WIDTH / 8;
    const std::vector<uint8_t>& c0 = m.display.plane(0).cells();
    const std::vector<uint8_t>& c1 = m.display.plane(1).cells();
    for (size_t row = 0; row < 16; row++) {
        CHECK_EQ(c0[row * bpr],     row * 2 + 1);
        CHECK_EQ(c0[row * bpr + 1], row * 2 + 2);
        CHECK_EQ(c1[row * bpr],     row * 2 + 33);
        CHECK_EQ(c1[row * bpr + 1], row * 2 + 34);
    }
}

// ============================================================================
// TRACE
// ============================================================================
static void test_trace_buffer() {
    Machine m({0x60, 0x01, 0x12, 0x00});
    Debugger dbg;
    for (size_t k = 0; k < Debugger::BUF_SIZE + 10; k++) {
        dbg.record(m.cpu);
        m.cpu.tick();
    }
    CHECK_EQ(dbg.size(), Debugger::BUF_SIZE);
    CHECK_EQ(dbg.newest().cycles, Debugger::BUF_SIZE + 9);

    const char* path = "cpu_test_trace.log";
    CHECK(dbg.dump(path));
    std::ifstream in(path);
    CHECK(in.is_open());
    std::remove(path);
}

int main() {
    printf("╔════════════════════════════════════════╗\n");
    printf("║        chipxo CPU Test Runner          ║\n");
    printf("╚════════════════════════════════════════╝\n\n");

    RUN(test_load_and_add);
    RUN(test_add_immediate_leaves_flag);
    RUN(test_call_and_return);
    RUN(test_jump_and_offset_jump);
    RUN(test_skips);
    RUN(test_long_load);
    RUN(test_exit);
    RUN(test_add_flag_sweep);
    RUN(test_sub_flag_sweep);
    RUN(test_flag_register_as_operand);
    RUN(test_logic);
    RUN(test_shifts_use_vy);
    RUN(test_random_is_masked);
    RUN(test_unknown_opcode);
    RUN(test_stack_limits);
    RUN(test_wait_for_key_edge);
    RUN(test_range_transfers);
    RUN(test_bcd_and_block_copy);
    RUN(test_flag_slots);
    RUN(test_font_addresses);
    RUN(test_memory_map);
    RUN(test_load_program_errors);
    RUN(test_delay_timer);
    RUN(test_sound_arms_port);
    RUN(test_draw_font_digit);
    RUN(test_mode_and_plane_opcodes);
    RUN(test_two_plane_draw_reads_both_halves);
    RUN(test_scroll_and_clear_opcodes);
    RUN(test_big_sprite_one_plane);
    RUN(test_big_sprite_two_planes);
    RUN(test_trace_buffer);

    return report("CPU results:");
}
