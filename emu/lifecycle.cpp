#include <stdexcept>
#include <pthread.h>
#include "lifecycle.hpp"

SignalWatcher::SignalWatcher(){
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &set_, &old_) != 0)
        throw std::runtime_error("pthread_sigmask failed");
}

SignalWatcher::~SignalWatcher(){
    if (th_.joinable()) {
        // wake sigwait with a signal the loop knows to ignore
        stopping_.store(true);
        if (!fired_.load()) pthread_kill(th_.native_handle(), SIGTERM);
        th_.join();
    }
    pthread_sigmask(SIG_SETMASK, &old_, nullptr);
}

void SignalWatcher::on_cancel(Callback cb){
    if (th_.joinable()) throw std::logic_error("cancel handler already registered");
    cb_ = std::move(cb);
    th_ = std::thread([this]{ loop(); });
}

void SignalWatcher::loop(){
    for(;;){
        int signo = 0;
        if (sigwait(&set_, &signo) != 0) continue;
        if (stopping_.load()) return;
        if (!fired_.exchange(true) && cb_) cb_(signo);
        return;
    }
}
