#include "deferred_call.hpp"

#include <utility>

namespace indiweb {
namespace server {

DeferredCall::~DeferredCall() { cancel(); }

namespace {
void join_or_detach(std::thread &thread) {
    if (!thread.joinable()) {
        return;
    }
    if (thread.get_id() == std::this_thread::get_id()) {
        // Replaced or cancelled from inside the callback
        thread.detach();
    } else {
        thread.join();
    }
}
}  // namespace

void DeferredCall::schedule(std::chrono::milliseconds delay, Callback callback) {
    // The old timer is swapped out and the new one armed in one critical
    // section, so concurrent schedule() calls never assign over a live thread
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(thread_);
        const uint64_t ticket = ++ticket_;
        armed_ = true;
        thread_ = std::thread(&DeferredCall::run, this, ticket, delay, std::move(callback));
    }
    cv_.notify_all();
    join_or_detach(previous);
}

void DeferredCall::cancel() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++ticket_;
        armed_ = false;
        finished = std::move(thread_);
    }
    cv_.notify_all();
    join_or_detach(finished);
}

bool DeferredCall::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

void DeferredCall::run(uint64_t ticket, std::chrono::milliseconds delay, Callback callback) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool cancelled = cv_.wait_for(lock, delay, [this, ticket] { return ticket_ != ticket; });
        if (cancelled) {
            return;
        }
        armed_ = false;
    }

    callback();
}

}  // namespace server
}  // namespace indiweb
