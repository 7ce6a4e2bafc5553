#pragma once
#include <cstdint>
#include <atomic>
#include <stdexcept>
#include <string>

class Memory;

// Bit-field helpers shared by the executor and the trap routines.
inline uint16_t get_bits(uint16_t v, int pos, int len){
    return (uint16_t)((v >> pos) & ((1u << len) - 1u));
}

// Two's-complement widen of the low `bits` bits to a full word.
inline uint16_t sign_extend(uint16_t v, int bits){
    if (bits >= 16) return v;
    v &= (uint16_t)((1u << bits) - 1u);
    if ((v >> (bits - 1)) & 1) v |= (uint16_t)(0xFFFFu << bits);
    return v;
}

class CPU {
public:
    // opcode = instr[15:12]
    enum class Op : uint8_t {
        BR = 0, ADD, LD, ST, JSR, AND, LDR, STR,
        RTI, NOT, LDI, STI, JMP, RES, LEA, TRAP
    };

    // condition codes, one-hot; BR's nzp field masks against these
    enum Flag : uint16_t { POS = 1 << 0, ZRO = 1 << 1, NEG = 1 << 2 };

    // trap vectors (instr[7:0])
    enum Vector : uint8_t {
        GETC = 0x20, OUT = 0x21, PUTS = 0x22, IN = 0x23, PUTSP = 0x24, HALT = 0x25
    };

    enum class Fault { None, ReservedOpcode, ConsoleRead };

    static constexpr uint16_t PC_START = 0x3000;
    static constexpr int      R7       = 7;      // link register

    // architectural state
    uint16_t r[8]  = {0};
    uint16_t pc    = PC_START;
    uint16_t cond  = ZRO;
    // accounting
    uint64_t instret = 0;
    // run state; HALT and the cancellation path are the only writers
    std::atomic<bool> running{true};
    Fault last_fault = Fault::None;

public:
    // back to power-on state (registers cleared, PC at PC_START, Z set)
    void reset(uint16_t start = PC_START);

    // Fetch, decode and retire one instruction. Returns false once the
    // machine has stopped. Throws CpuFault on a fatal condition.
    bool step(Memory& mem);

    // keep stepping until HALT or cancel()
    void run(Memory& mem);

    // external stop request (signal thread)
    void cancel(){ running.store(false); }

    void update_flags(int reg);

    static const char* op_name(Op op);
    static const char* fault_name(Fault f);
};

struct CpuFault : std::runtime_error {
    CPU::Fault kind;
    uint16_t   pc;        // address of the faulting instruction
    CpuFault(CPU::Fault k, uint16_t at, const std::string& what)
    : std::runtime_error(what), kind(k), pc(at) {}
};
