#pragma once
#include <cstdint>
#include <atomic>
#include <stdexcept>
#include <termios.h>

// Raised when a character was required but the console could not supply one.
struct ConsoleError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Keyboard + display seen by the machine. Only Memory (for the
// memory-mapped keyboard registers) and the trap routines talk to it.
class Console {
public:
    virtual ~Console() = default;

    // non-blocking: is a character waiting?
    virtual bool poll_ready() = 0;
    // blocking: next character code, or -1 on end of input / error
    virtual int  read_char() = 0;
    // unbuffered: the byte is visible on return
    virtual void write_char(uint8_t c) = 0;
};

// Host console on stdin/stdout. Once stdin hits end of input it stays
// "not ready" instead of reporting a readable descriptor forever.
class TermConsole : public Console {
public:
    bool poll_ready() override;
    int  read_char() override;
    void write_char(uint8_t c) override;

    bool at_eof() const { return eof_; }

private:
    bool eof_ = false;
};

// Puts the terminal on stdin into non-canonical, non-echo mode from
// engage() until restore() or destruction. Constructing it does not touch
// the terminal, so it can be declared before the signal watcher that
// restores it. restore() may also be called from the cancellation thread;
// whichever caller gets there first does the work.
class RawModeGuard {
public:
    RawModeGuard() = default;
    ~RawModeGuard();

    // returns false when stdin is not a terminal (nothing to do)
    bool engage();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    void restore();
    bool active() const { return active_.load(); }

private:
    struct termios saved_{};
    std::atomic<bool> active_{false};
};
