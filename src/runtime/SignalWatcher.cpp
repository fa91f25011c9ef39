#include "runtime/SignalWatcher.hpp"
#include "log/Registry.hpp"

#include <pthread.h>

#include <cstring>
#include <string>
#include <exception>
#include <stdexcept>

using namespace cs::runtime;

SignalWatcher::SignalWatcher(Handler handler) : handler_(std::move(handler)) {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    sigaddset(&set_, SIGHUP);

    if (const int rc = ::pthread_sigmask(SIG_BLOCK, &set_, &previous_); rc != 0)
        throw std::runtime_error(std::string("Unable to block signals: ") + std::strerror(rc));

    thread_ = std::thread([this] { loop(); });
}

SignalWatcher::~SignalWatcher() {
    stopping_ = true;
    ::pthread_kill(thread_.native_handle(), SIGTERM);
    thread_.join();
    ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

void SignalWatcher::loop() {
    for (;;) {
        int signo = 0;
        if (const int rc = ::sigwait(&set_, &signo); rc != 0) {
            log::Registry::cloudsync()->error("[SignalWatcher] sigwait failed: {}", std::strerror(rc));
            return;
        }
        if (stopping_) return;

        log::Registry::cloudsync()->warn("[SignalWatcher] Received {}, stopping", ::strsignal(signo));
        try {
            handler_(signo);
        } catch (const std::exception& e) {
            log::Registry::cloudsync()->error("[SignalWatcher] Handler for {} failed: {}", ::strsignal(signo), e.what());
        }
    }
}
