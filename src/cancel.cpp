#include "rping/cancel.hpp"
#include "rping/log.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <string>
#include <system_error>

#include <pthread.h>

namespace rping {

// How often the watcher re-checks its stop flag
static constexpr long kWatchSliceNs = 200L * 1000 * 1000;

// ============================================================================
// CancelToken
// ============================================================================
void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancelToken::cancelled() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cancelled_;
}

bool CancelToken::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, d, [this] { return cancelled_; });
    return cancelled_;
}


// ============================================================================
// SignalWatcher
// ============================================================================
SignalWatcher::SignalWatcher(CancelToken& token) : token_(token) {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
}

SignalWatcher::~SignalWatcher() {
    stop();
}

bool SignalWatcher::start() {
    if (running_.load())
        return true;

    int rc = ::pthread_sigmask(SIG_BLOCK, &set_, nullptr);
    if (rc != 0) {
        log(LogLevel::ERROR, std::string("pthread_sigmask failed: ") + std::strerror(rc));
        return false;
    }

    running_ = true;
    try {
        thread_ = std::thread(&SignalWatcher::run, this);
    } catch (const std::system_error& e) {
        running_ = false;
        ::pthread_sigmask(SIG_UNBLOCK, &set_, nullptr);
        log(LogLevel::ERROR, std::string("signal watcher thread: ") + e.what());
        return false;
    }
    return true;
}

void SignalWatcher::stop() {
    running_ = false;
    if (thread_.joinable())
        thread_.join();
}

void SignalWatcher::run() {
    timespec slice{};
    slice.tv_sec  = 0;
    slice.tv_nsec = kWatchSliceNs;

    while (running_.load()) {
        int sig = ::sigtimedwait(&set_, nullptr, &slice);
        if (sig < 0) {
            if (errno == EAGAIN || errno == EINTR)
                continue;
            log(LogLevel::ERROR, std::string("sigtimedwait failed: ") + std::strerror(errno));
            return;
        }
        log(LogLevel::DEBUG, std::string("received ") + ::strsignal(sig));
        token_.cancel();
        return;
    }
}

} // namespace rping
