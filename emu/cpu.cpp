#include <cstdint>
#include <sstream>
#include <iomanip>
#include "cpu.hpp"
#include "mem.hpp"
#include "trap.hpp"
#include "trace.hpp"

void CPU::reset(uint16_t start)
{
    for (auto& v : r) v = 0;
    pc      = start;
    cond    = ZRO;
    instret = 0;
    running.store(true);
    last_fault = Fault::None;
}

void CPU::update_flags(int reg)
{
    const uint16_t v = r[reg];
    if (v >> 15)       cond = NEG;
    else if (v == 0)   cond = ZRO;
    else               cond = POS;
}

static std::string fault_text(CPU::Fault f, uint16_t at, uint16_t inst)
{
    std::ostringstream os;
    os << CPU::fault_name(f) << " at pc=0x" << std::hex << std::setw(4)
       << std::setfill('0') << at << " (instr 0x" << std::setw(4) << inst << ")";
    return os.str();
}

bool CPU::step(Memory& mem)
{
    if (!running.load()) return false;

    const uint16_t at = pc;
    uint16_t inst = 0;

    try {
        inst = mem.read(pc++);

        const Op op   = static_cast<Op>(inst >> 12);
        const int dr  = get_bits(inst, 9, 3);     // DR / SR for stores / nzp for BR
        const int sr1 = get_bits(inst, 6, 3);     // SR1 / BaseR

        switch (op)
        {
        case Op::ADD:
        case Op::AND: {
            uint16_t b = get_bits(inst, 5, 1) ? sign_extend(get_bits(inst, 0, 5), 5)
                                              : r[get_bits(inst, 0, 3)];
            r[dr] = (op == Op::ADD) ? (uint16_t)(r[sr1] + b) : (uint16_t)(r[sr1] & b);
            update_flags(dr);
            break;
        }
        case Op::NOT:
            r[dr] = (uint16_t)~r[sr1];
            update_flags(dr);
            break;
        case Op::BR:
            if (dr & cond) pc += sign_extend(get_bits(inst, 0, 9), 9);
            break;
        case Op::JMP:                            // RET is JMP R7
            pc = r[sr1];
            break;
        case Op::JSR: {
            const uint16_t target = get_bits(inst, 11, 1)
                ? (uint16_t)(pc + sign_extend(get_bits(inst, 0, 11), 11))   // JSR
                : r[sr1];                                                    // JSRR
            r[R7] = pc;
            pc = target;
            break;
        }
        case Op::LD:
            r[dr] = mem.read(pc + sign_extend(get_bits(inst, 0, 9), 9));
            update_flags(dr);
            break;
        case Op::LDI:
            r[dr] = mem.read(mem.read(pc + sign_extend(get_bits(inst, 0, 9), 9)));
            update_flags(dr);
            break;
        case Op::LDR:
            r[dr] = mem.read(r[sr1] + sign_extend(get_bits(inst, 0, 6), 6));
            update_flags(dr);
            break;
        case Op::LEA:
            r[dr] = (uint16_t)(pc + sign_extend(get_bits(inst, 0, 9), 9));
            update_flags(dr);
            break;
        case Op::ST:
            mem.write(pc + sign_extend(get_bits(inst, 0, 9), 9), r[dr]);
            break;
        case Op::STI:
            mem.write(mem.read(pc + sign_extend(get_bits(inst, 0, 9), 9)), r[dr]);
            break;
        case Op::STR:
            mem.write(r[sr1] + sign_extend(get_bits(inst, 0, 6), 6), r[dr]);
            break;
        case Op::TRAP:
            r[R7] = pc;
            handle_trap(*this, mem, (uint8_t)get_bits(inst, 0, 8));
            break;
        case Op::RES:
        case Op::RTI:
        default:
            last_fault = Fault::ReservedOpcode;
            running.store(false);
            throw CpuFault(last_fault, at, fault_text(last_fault, at, inst));
        }
    } catch (const ConsoleError&) {          // GETC/IN with no input left
        last_fault = Fault::ConsoleRead;
        running.store(false);
        throw CpuFault(last_fault, at, fault_text(last_fault, at, inst));
    }

    instret++;
    global_trace().push(at, inst, (uint8_t)(inst >> 12), instret);

    return running.load();
}

void CPU::run(Memory& mem)
{
    while (step(mem)) {}
}

const char* CPU::op_name(Op op)
{
    static const char* const names[16] = {
        "BR", "ADD", "LD", "ST", "JSR", "AND", "LDR", "STR",
        "RTI", "NOT", "LDI", "STI", "JMP", "RES", "LEA", "TRAP"
    };
    return names[static_cast<uint8_t>(op) & 0xF];
}

const char* CPU::fault_name(Fault f)
{
    switch (f) {
    case Fault::None:           return "none";
    case Fault::ReservedOpcode: return "reserved opcode";
    case Fault::ConsoleRead:    return "console read failed";
    }
    return "?";
}
