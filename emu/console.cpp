#include <iostream>
#include <cerrno>
#include <sys/select.h>
#include <unistd.h>
#include "console.hpp"

bool TermConsole::poll_ready(){
    if (eof_) return false;
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(STDIN_FILENO, &fds);
    struct timeval tv{0, 0};     // poll, never wait
    return ::select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv) > 0;
}

int TermConsole::read_char(){
    unsigned char c = 0;
    for(;;){
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n == 1) return c;
        if (n < 0 && errno == EINTR) continue;
        eof_ = true;                // EOF or hard error (pty hangup is EIO)
        return -1;
    }
}

void TermConsole::write_char(uint8_t c){
    std::cout.put(static_cast<char>(c));
    std::cout.flush();
}

// ---------------- raw mode ----------------

bool RawModeGuard::engage(){
    if (active_.load()) return true;
    if (!::isatty(STDIN_FILENO)) return false;    // piped input: nothing to do
    if (::tcgetattr(STDIN_FILENO, &saved_) != 0) return false;

    struct termios raw = saved_;
    raw.c_lflag &= ~(ICANON | ECHO);
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) return false;
    active_.store(true);
    return true;
}

RawModeGuard::~RawModeGuard(){ restore(); }

void RawModeGuard::restore(){
    // only tcsetattr in here: safe to call from the signal thread
    if (active_.exchange(false))
        ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
}
