#pragma once
#include <atomic>
#include <functional>
#include <thread>
#include <signal.h>

// Waits for SIGINT/SIGTERM on a dedicated thread and runs the cancel
// callback once. Construct it on the main thread before any other thread
// is started so every thread inherits the blocked mask.
class SignalWatcher {
public:
    using Callback = std::function<void(int signo)>;

    SignalWatcher();
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Register the handler and start watching. Only one registration.
    void on_cancel(Callback cb);

    bool fired() const { return fired_.load(); }

private:
    void loop();

    sigset_t          set_;
    sigset_t          old_;
    Callback          cb_;
    std::thread       th_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> fired_{false};
};
