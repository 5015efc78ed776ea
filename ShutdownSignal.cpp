#include "ShutdownSignal.h"
#include "Logger.h"

#include <pthread.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

const char* FILE_NAME = "ShutdownSignal.cpp";
const char* CLASS_NAME = "ShutdownSignal";

} // namespace

ShutdownSignal::ShutdownSignal(std::initializer_list<int> list) : wakeSignal(*list.begin()) {
    sigemptyset(&signals);
    for (int sig : list) {
        sigaddset(&signals, sig);
    }
    int rc = pthread_sigmask(SIG_BLOCK, &signals, &previousMask);
    if (rc != 0) {
        throw std::runtime_error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
}

ShutdownSignal::~ShutdownSignal() {
    stopWaiting();
    pthread_sigmask(SIG_SETMASK, &previousMask, nullptr);
}

void ShutdownSignal::start(Callback callback) {
    if (waiter.joinable()) {
        return;
    }
    onSignal = std::move(callback);
    cancelled = false;
    waiter = std::thread(&ShutdownSignal::waitLoop, this);
}

void ShutdownSignal::stopWaiting() {
    if (!waiter.joinable()) {
        return;
    }
    cancelled = true;
    // The signal is blocked on the waiter too, so it is consumed by its sigwait().
    pthread_kill(waiter.native_handle(), wakeSignal);
    waiter.join();
}

void ShutdownSignal::waitLoop() {
    while (true) {
        int sig = 0;
        int rc = sigwait(&signals, &sig);
        if (cancelled) {
            return;
        }
        if (rc != 0) {
            SaveLogs::log_error(FILE_NAME, CLASS_NAME, "waitLoop", std::string("sigwait failed: ") + std::strerror(rc));
            return;
        }
        SaveLogs::log_info(FILE_NAME, CLASS_NAME, "waitLoop", "Received signal " + std::to_string(sig));
        onSignal(sig);
    }
}
