#pragma once

#include <signal.h>

#include <atomic>
#include <functional>
#include <thread>

namespace cs::runtime {

// Turns SIGINT, SIGTERM and SIGHUP into calls to `handler` on a dedicated
// thread. The constructor blocks those signals in the calling thread, so
// only threads started after it inherit the mask: construct it before any
// job thread exists, and destroy it on the same thread.
class SignalWatcher {
public:
    using Handler = std::function<void(int signo)>;

    explicit SignalWatcher(Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    sigset_t set_{};
    sigset_t previous_{};
    Handler handler_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;

    void loop();
};

}
