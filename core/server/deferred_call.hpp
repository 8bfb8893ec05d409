#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace indiweb {
namespace server {

// DeferredCall runs one callback after a delay on its own thread.
//
// - schedule() replaces any pending call; the replaced timer is joined
//   after the new one is armed, so concurrent schedule() calls are safe
// - cancel() wakes the timer thread and joins it; the callback does not run
//   unless it had already started
// - The destructor cancels
//
// cancel() joins, so it must not be called while holding a lock the
// callback itself takes.
class DeferredCall {
public:
    using Callback = std::function<void()>;

    DeferredCall() = default;
    ~DeferredCall();

    DeferredCall(const DeferredCall &) = delete;
    DeferredCall &operator=(const DeferredCall &) = delete;

    void schedule(std::chrono::milliseconds delay, Callback callback);
    void cancel();

    // True while armed and the callback has not started yet
    bool pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    uint64_t ticket_ = 0;  // Bumped by every schedule/cancel
    bool armed_ = false;

    void run(uint64_t ticket, std::chrono::milliseconds delay, Callback callback);
};

}  // namespace server
}  // namespace indiweb
