#include "test_util.hpp"

static bool flags_match(const CPU& c, uint16_t v){
    if (v & 0x8000) return c.cond == CPU::NEG;
    if (v == 0)     return c.cond == CPU::ZRO;
    return c.cond == CPU::POS;
}

int main(){
    TestCtx t;

    // sign extension: low b bits kept, bits b..15 copy bit b-1
    {
        bool good = true;
        for (int b = 1; b <= 16 && good; ++b){
            for (uint32_t x = 0; x <= 0xFFFF; ++x){
                uint16_t v    = sign_extend((uint16_t)x, b);
                uint16_t low  = (b == 16) ? 0xFFFF : (uint16_t)((1u << b) - 1);
                uint16_t sign = (x >> (b - 1)) & 1;
                uint16_t high = sign ? (uint16_t)~low : 0;
                if ((v & low) != (x & low) || (v & ~low & 0xFFFF) != high){ good = false; break; }
            }
        }
        t.ok(good, "sign_extend property over all words and widths");
        t.ok(sign_extend(0x1F, 5)  == 0xFFFF, "imm5 -1");
        t.ok(sign_extend(0x0F, 5)  == 0x000F, "imm5 +15");
        t.ok(sign_extend(0x100, 9) == 0xFF00, "off9 -256");
    }

    // update_flags: exactly one of N/Z/P
    {
        CPU c;
        const uint16_t samples[] = {0, 1, 0x7FFF, 0x8000, 0xFFFF, 0x1234};
        bool good = true;
        for (uint16_t v : samples){
            c.r[3] = v; c.update_flags(3);
            good = good && flags_match(c, v);
        }
        t.ok(good, "update_flags N/Z/P");
    }

    // power-on state
    {
        CPU c;
        t.ok(c.pc == 0x3000 && c.cond == CPU::ZRO && c.running.load(), "reset state");
    }

    // ADD R0,R1,#-1 with R1=0 -> 0xFFFF, N
    {
        Memory m; CPU c;
        load_prog(m, encADDi(0, 1, -1));
        c.step(m);
        t.ok(c.r[0] == 0xFFFF && c.cond == CPU::NEG, "ADD imm wraps to 0xFFFF/N");
        t.ok(c.pc == 0x3001, "PC advanced by one");
    }

    // ADD register mode, wraparound and Z
    {
        Memory m; CPU c;
        load_prog(m, encADD(2, 0, 1), encADD(3, 4, 5));
        c.r[0] = 0x7FFF; c.r[1] = 1;
        c.r[4] = 0xFFFF; c.r[5] = 1;
        c.step(m);
        t.ok(c.r[2] == 0x8000 && c.cond == CPU::NEG, "ADD reg 0x7FFF+1");
        c.step(m);
        t.ok(c.r[3] == 0 && c.cond == CPU::ZRO, "ADD reg 0xFFFF+1 -> 0/Z");
    }

    // AND
    {
        Memory m; CPU c;
        load_prog(m, encANDi(0, 0, 0), encAND(1, 2, 3), encANDi(4, 2, 0x0F));
        c.r[0] = 0xBEEF; c.r[2] = 0xF0F3; c.r[3] = 0x0FF1;
        c.step(m);
        t.ok(c.r[0] == 0 && c.cond == CPU::ZRO, "AND #0 clears");
        c.step(m);
        t.ok(c.r[1] == 0x00F1 && c.cond == CPU::POS, "AND reg");
        c.step(m);
        t.ok(c.r[4] == 0x0003, "AND imm");
    }

    // NOT
    {
        Memory m; CPU c;
        load_prog(m, encNOT(1, 1));
        c.step(m);
        t.ok(c.r[1] == 0xFFFF && c.cond == CPU::NEG, "NOT 0");
    }

    // BR taken / not taken / backwards; flags untouched
    {
        Memory m; CPU c;
        load_prog(m, encBR(CPU::ZRO, 5));
        c.step(m);
        t.ok(c.pc == 0x3006, "BRz taken on Z");
        t.ok(c.cond == CPU::ZRO, "BR keeps COND");
    }
    {
        Memory m; CPU c;
        load_prog(m, encBR(CPU::POS | CPU::NEG, 5));
        c.step(m);
        t.ok(c.pc == 0x3001, "BRnp not taken on Z");
    }
    {
        Memory m; CPU c;
        load_prog(m, encBR(7, -2));
        c.step(m);
        t.ok(c.pc == 0x2FFF, "BRnzp backwards");
    }
    {
        Memory m; CPU c;
        load_prog(m, encBR(0, 5));
        c.step(m);
        t.ok(c.pc == 0x3001, "BR with no condition bits never taken");
    }

    // JMP / RET
    {
        Memory m; CPU c;
        load_prog(m, encJMP(2));
        c.r[2] = 0x4321;
        c.step(m);
        t.ok(c.pc == 0x4321, "JMP R2");
    }

    // JSR: R7 = next instruction, PC-relative target
    {
        Memory m; CPU c;
        load_prog(m, encJSR(0x10));
        c.step(m);
        t.ok(c.r[7] == 0x3001 && c.pc == 0x3011, "JSR links and jumps");
    }
    {
        Memory m; CPU c;
        load_prog(m, encJSR(-1));
        c.step(m);
        t.ok(c.pc == 0x3000, "JSR negative offset");
    }
    // JSRR R7 behaves like RET
    {
        Memory m1, m2; CPU a, b;
        load_prog(m1, encJSRR(7));
        load_prog(m2, encRET());
        a.r[7] = 0x5000; b.r[7] = 0x5000;
        a.step(m1); b.step(m2);
        t.ok(a.pc == 0x5000 && a.pc == b.pc, "JSRR R7 jumps to prior R7");
        t.ok(a.r[7] == 0x3001, "JSRR links after reading base");
    }

    // LD / LDI / LDR / LEA
    {
        Memory m; CPU c;
        load_prog(m, encLD(3, 4));
        m.write(0x3005, 0x1234);
        c.step(m);
        t.ok(c.r[3] == 0x1234 && c.cond == CPU::POS, "LD");
    }
    {
        Memory m; CPU c;
        load_prog(m, encLDI(0, 2));
        m.write(0x3003, 0x4000);          // pointer
        m.write(0x4000, 0xBEEF);          // value
        c.step(m);
        t.ok(c.r[0] == 0xBEEF && c.cond == CPU::NEG, "LDI double indirection");
    }
    {
        Memory m; CPU c;
        load_prog(m, encLDR(1, 2, -1), encLDR(5, 2, 31));
        m.write(0x3FFF, 7); m.write(0x401F, 0);
        c.r[2] = 0x4000; c.r[5] = 9;
        c.step(m);
        t.ok(c.r[1] == 7, "LDR negative offset");
        c.step(m);
        t.ok(c.r[5] == 0 && c.cond == CPU::ZRO, "LDR positive offset");
    }
    {
        Memory m; CPU c;
        load_prog(m, encLEA(1, -1));
        c.step(m);
        t.ok(c.r[1] == 0x3000 && c.cond == CPU::POS, "LEA sets DR and flags");
    }

    // ST / STI / STR leave COND alone
    {
        Memory m; CPU c;
        load_prog(m, encST(1, 3), encSTI(2, 3), encSTR(3, 4, -2));
        m.write(0x3005, 0x6000);          // STI pointer (0x3002 + 3)
        c.r[1] = 0xAAAA; c.r[2] = 0xBBBB; c.r[3] = 0xCCCC; c.r[4] = 0x7002;
        c.cond = CPU::POS;
        c.step(m); c.step(m); c.step(m);
        t.ok(m.peek(0x3004) == 0xAAAA, "ST");
        t.ok(m.peek(0x6000) == 0xBBBB, "STI");
        t.ok(m.peek(0x7000) == 0xCCCC, "STR");
        t.ok(c.cond == CPU::POS, "stores keep COND");
    }

    // PC wraps at the top of memory
    {
        Memory m; CPU c;
        c.pc = 0xFFFF;
        m.write(0xFFFF, encADDi(0, 0, 1));
        c.step(m);
        t.ok(c.pc == 0x0000 && c.r[0] == 1, "PC wraps 0xFFFF -> 0");
    }

    // RES and RTI are fatal
    {
        const CPU::Op bad[] = { CPU::Op::RES, CPU::Op::RTI };
        for (CPU::Op op : bad){
            Memory m; CPU c;
            load_prog(m, enc(op, 0));
            bool threw = false;
            try { c.step(m); }
            catch (const CpuFault& f){
                threw = (f.kind == CPU::Fault::ReservedOpcode && f.pc == 0x3000);
            }
            t.ok(threw, "reserved opcode throws CpuFault");
            t.ok(!c.running.load() && c.last_fault == CPU::Fault::ReservedOpcode,
                 "reserved opcode stops the machine");
        }
    }

    // small loop: R1 = 5+4+3+2+1, then HALT
    {
        FakeConsole con;
        Memory m(&con); CPU c;
        load_prog(m,
            encANDi(0, 0, 0),
            encADDi(0, 0, 5),
            encANDi(1, 1, 0),
            encADD (1, 1, 0),
            encADDi(0, 0, -1),
            encBR  (CPU::POS, -3),
            encTRAP(CPU::HALT));
        run_for(c, m);
        t.ok(c.r[1] == 15 && c.r[0] == 0, "loop sums 1..5");
        t.ok(!c.running.load() && c.instret == 19, "loop halts after 19 instructions");
        t.ok(con.output == "HALT\n", "HALT banner");
    }

    // cancel() stops the loop before the next fetch
    {
        Memory m; CPU c;
        load_prog(m, encADDi(0, 0, 1));
        c.cancel();
        t.ok(!c.step(m) && c.pc == 0x3000 && c.r[0] == 0, "cancelled CPU does not fetch");
    }

    return t.summary("cpu");
}
