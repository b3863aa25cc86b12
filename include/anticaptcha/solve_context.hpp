#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace anticaptcha {

// Deadline and cancellation scope of one solve operation. Every blocking
// point (HTTP transfer, wait between polls) checks it.
class SolveContext {
public:
    using Clock = std::chrono::steady_clock;

    explicit SolveContext(std::chrono::milliseconds timeout);

    SolveContext(const SolveContext&) = delete;
    SolveContext& operator=(const SolveContext&) = delete;

    // Safe to call from any thread; wakes a pending waitFor().
    void cancel();

    bool cancelled() const;
    bool expired() const;
    Clock::time_point deadline() const { return deadlineAt; }
    std::chrono::milliseconds remaining() const;

    // Sleeps for `interval` unless the context fires first. Returns false
    // when it returned because of cancellation or deadline expiry.
    bool waitFor(std::chrono::milliseconds interval) const;

    // Throws CancellationError naming `operation` if the context has fired.
    void throwIfDone(const std::string& operation) const;

private:
    Clock::time_point deadlineAt;
    mutable std::mutex mutex;
    mutable std::condition_variable wakeup;
    bool cancelFlag = false;
};

} // namespace anticaptcha
