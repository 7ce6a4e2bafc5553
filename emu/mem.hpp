#pragma once
#include <cstdint>
#include <vector>
#include <algorithm>
#include "console.hpp"

class Memory {
public:
    static constexpr uint32_t WORDS = 1u << 16;

    // memory-mapped keyboard registers
    static constexpr uint16_t KBSR = 0xFE00;   // status: bit 15 = key ready
    static constexpr uint16_t KBDR = 0xFE02;   // data: last polled character

    explicit Memory(Console* con = nullptr)
    : words_(WORDS, 0), con_(con) {}

    void attach_console(Console* con){ con_ = con; }
    Console* console() const { return con_; }

    // ------- word access (addresses are 16-bit, wrap is implicit) -------
    uint16_t read(uint16_t addr) {
        if (addr == KBSR) poll_keyboard();
        return words_[addr];
    }

    void write(uint16_t addr, uint16_t value) {
        words_[addr] = value;
    }

    // raw view without device side effects (loader checks, tests)
    uint16_t peek(uint16_t addr) const { return words_[addr]; }

    void clear(){ std::fill(words_.begin(), words_.end(), 0); }

private:
    // ---------------- MMIO ----------------
    // Every KBSR read re-samples the console; never blocks and never
    // fails. End of input reads as "no key", KBDR keeps its last value.
    void poll_keyboard() {
        words_[KBSR] = 0;
        if (con_ && con_->poll_ready()) {
            int c = con_->read_char();
            if (c < 0) return;
            words_[KBSR] = 1u << 15;
            words_[KBDR] = static_cast<uint16_t>(c);
        }
    }

private:
    std::vector<uint16_t> words_;
    Console* con_;
};
