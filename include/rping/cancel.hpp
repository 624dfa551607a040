#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <signal.h>

namespace rping {

/**
 * One-shot cancellation flag shared between the signal watcher and the
 * probe loop. wait_for() is the loop's interruptible sleep.
 */
class CancelToken {
   public:
    void cancel();
    bool cancelled() const;

    /**
     * Sleep for up to @p d, returning early if cancel() is called.
     * @return true if the token is cancelled.
     */
    bool wait_for(std::chrono::milliseconds d);

   private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool cancelled_{false};
};

/**
 * Dedicated thread that turns SIGINT / SIGTERM into CancelToken::cancel().
 *
 * start() blocks both signals in the calling thread (and so in every thread
 * created afterwards), then waits for them with sigtimedwait(). Call it
 * from main() before any other thread exists.
 */
class SignalWatcher {
   public:
    explicit SignalWatcher(CancelToken& token);
    ~SignalWatcher();
    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    bool start();
    void stop();

   private:
    void run();

    CancelToken& token_;
    sigset_t set_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace rping
