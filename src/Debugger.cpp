#include "Debugger.hpp"
#include "cpu/chip8.hpp"
#include <fstream>
#include <iostream>
#include <cstdio>

void Debugger::record(const Chip8& cpu) {
    TraceEntry& te = buf_[head_];
    te.pc     = cpu.get_pc();
    te.opcode = cpu.next_opcode();
    te.i      = cpu.get_i();
    te.sp     = cpu.get_sp();
    for (uint8_t r = 0; r < te.v.size(); r++) te.v[r] = cpu.get_v(r);
    te.cycles = cpu.get_cycles();
    head_ = (head_ + 1) % BUF_SIZE;
    if (count_ < BUF_SIZE) count_++;
}

bool Debugger::dump(const std::string& path) const {
    if (count_ == 0) return false;

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "[TRACE] Could not open " << path << "\n";
        return false;
    }
    out << "# chipxo trace - last " << count_ << " instructions\n";
    out << "#       CYCLE   PC   OP    I SP  V0 V1 V2 V3 V4 V5 V6 V7 V8 V9 VA VB VC VD VE VF\n";

    size_t start = (count_ < BUF_SIZE) ? 0 : head_;
    for (size_t n = 0; n < count_; n++) {
        const TraceEntry& e = buf_[(start + n) % BUF_SIZE];
        char line[128];
        int len = snprintf(line, sizeof(line), "%12llu  %04X %04X %04X %2u ",
                           (unsigned long long)e.cycles, e.pc, e.opcode, e.i,
                           (unsigned)e.sp);
        for (uint8_t r : e.v) {
            if (len < 0 || static_cast<size_t>(len) >= sizeof(line)) break;
            len += snprintf(line + len, sizeof(line) - len, " %02X", r);
        }
        out << line << "\n";
    }
    out.close();
    std::cerr << "[TRACE] Dumped " << count_ << " instructions to " << path << "\n";
    return true;
}
