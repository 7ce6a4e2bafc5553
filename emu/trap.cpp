#include "cpu.hpp"
#include "mem.hpp"
#include "trap.hpp"

// Trap ABI (no guest OS; routines run on the host):
//   R0 = argument (character or string address) / result (character)
//   R7 = return address, linked by the TRAP instruction
//
// Vectors:
//   0x20 GETC   read one char into R0, no echo
//   0x21 OUT    write char R0[7:0]
//   0x22 PUTS   write string at R0, one char per word, 0-terminated
//   0x23 IN     prompt, read one char, echo it, into R0
//   0x24 PUTSP  write string at R0, two chars per word (low byte first)
//   0x25 HALT   stop the machine

static void put(Console* con, uint16_t c){
    if (con) con->write_char(static_cast<uint8_t>(c & 0xFF));
}

static void put_text(Console* con, const char* s){
    while (*s) put(con, (uint8_t)*s++);
}

static uint16_t get(Console* con){
    if (!con) throw ConsoleError("no console attached");
    int c = con->read_char();
    if (c < 0) throw ConsoleError("end of console input");
    return static_cast<uint16_t>(c);
}

bool handle_trap(CPU& cpu, Memory& mem, uint8_t vector){
    Console* con = mem.console();

    switch(vector){
    case CPU::GETC: {
        cpu.r[0] = get(con);
        cpu.update_flags(0);
        return true;
    }
    case CPU::OUT: {
        put(con, cpu.r[0]);
        return true;
    }
    case CPU::PUTS: {
        // stops on the terminator without looking past it; strings are
        // read raw so a string crossing KBSR does not eat a keystroke
        uint16_t a = cpu.r[0];
        for (uint32_t n = 0; n < Memory::WORDS; ++n, ++a) {
            uint16_t w = mem.peek(a);
            if (w == 0) break;
            put(con, w);
        }
        return true;
    }
    case CPU::IN: {
        put_text(con, "Enter a character: ");
        uint16_t c = get(con);
        put(con, c);
        cpu.r[0] = c;
        cpu.update_flags(0);
        return true;
    }
    case CPU::PUTSP: {
        uint16_t a = cpu.r[0];
        for (uint32_t n = 0; n < Memory::WORDS; ++n, ++a) {
            uint16_t w  = mem.peek(a);
            uint16_t lo = w & 0xFF, hi = w >> 8;
            if (lo == 0) break;
            put(con, lo);
            if (hi) put(con, hi);
        }
        return true;
    }
    case CPU::HALT: {
        put_text(con, "HALT\n");
        cpu.running.store(false);
        return true;
    }

    default:
        return false;
    }
}
