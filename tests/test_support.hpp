#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <gmock/gmock.h>

#include "anticaptcha/http_transport.hpp"
#include "anticaptcha/logger.hpp"

namespace anticaptcha::testing {

class MockTransport : public HttpTransport {
public:
    MOCK_METHOD(HttpResponse, post,
                (const std::string& url,
                 const std::string& body,
                 const std::vector<std::string>& headers,
                 std::chrono::milliseconds timeout,
                 const SolveContext& context),
                (override));
};

// Keeps every line so tests can assert on what was (and was not) logged.
class CapturingLogger : public Logger {
public:
    void info(std::string_view msg) override { add("INFO", msg); }
    void warn(std::string_view msg) override { add("WARN", msg); }
    void error(std::string_view msg) override { add("ERROR", msg); }
    void debug(std::string_view msg) override { add("DEBUG", msg); }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex);
        return captured;
    }

    bool contains(const std::string& needle) const {
        for (const auto& line : lines()) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    void add(std::string_view level, std::string_view msg) {
        std::lock_guard<std::mutex> lock(mutex);
        captured.push_back(std::string(level) + " " + std::string(msg));
    }

    mutable std::mutex mutex;
    std::vector<std::string> captured;
};

inline HttpResponse ok(const std::string& body) {
    return HttpResponse{200, body};
}

} // namespace anticaptcha::testing
