#include "anticaptcha/solve_context.hpp"
#include "anticaptcha/errors.hpp"

namespace anticaptcha {

SolveContext::SolveContext(std::chrono::milliseconds timeout)
    : deadlineAt(Clock::now() + timeout) {}

void SolveContext::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelFlag = true;
    }
    wakeup.notify_all();
}

bool SolveContext::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex);
    return cancelFlag;
}

bool SolveContext::expired() const {
    return cancelled() || Clock::now() >= deadlineAt;
}

std::chrono::milliseconds SolveContext::remaining() const {
    // Rounded up so a timeout derived from it never ends before the deadline.
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadlineAt - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool SolveContext::waitFor(std::chrono::milliseconds interval) const {
    std::unique_lock<std::mutex> lock(mutex);
    auto until = Clock::now() + interval;
    bool deadlineFirst = deadlineAt < until;
    if (deadlineFirst) {
        until = deadlineAt;
    }
    if (wakeup.wait_until(lock, until, [this] { return cancelFlag; })) {
        return false;
    }
    return !deadlineFirst;
}

void SolveContext::throwIfDone(const std::string& operation) const {
    if (cancelled()) {
        throw CancellationError(operation + ": operation cancelled");
    }
    if (Clock::now() >= deadlineAt) {
        throw CancellationError(operation + ": deadline exceeded");
    }
}

} // namespace anticaptcha
