#pragma once
#include <cstdint>
#include <array>
#include <string>

class Chip8;

struct TraceEntry {
    uint16_t pc, opcode, i;
    uint8_t  sp;
    std::array<uint8_t, 16> v;
    uint64_t cycles;
};

// Circular trace buffer.
// Call record() before every tick and dump() to write trace.log.
class Debugger {
public:
    static constexpr size_t BUF_SIZE = 500;

    // Snapshot current CPU state into the circular buffer.
    void record(const Chip8& cpu);

    // Write the buffered instructions, oldest first, to `path`.
    bool dump(const std::string& path = "trace.log") const;

    size_t size() const { return count_; }
    const TraceEntry& newest() const { return buf_[(head_ + BUF_SIZE - 1) % BUF_SIZE]; }

private:
    std::array<TraceEntry, BUF_SIZE> buf_{};
    size_t head_  = 0;
    size_t count_ = 0;
};
