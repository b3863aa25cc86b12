#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace anticaptcha {

class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
    virtual void debug(std::string_view msg) = 0;
};

// Writes "<prefix>YYYY/MM/DD HH:MM:SS LEVEL message" lines to a stream.
class StreamLogger : public Logger {
public:
    explicit StreamLogger(std::ostream& out = std::cout,
                          std::string prefix = "AntiCaptcha: ",
                          bool enableDebug = false);

    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void setDebug(bool enabled) { enableDebug.store(enabled); }

private:
    void write(std::string_view level, std::string_view msg);

    std::ostream& out;
    std::string prefix;
    std::atomic<bool> enableDebug;
    std::mutex writeMutex;
};

class NullLogger : public Logger {
public:
    void info(std::string_view) override {}
    void warn(std::string_view) override {}
    void error(std::string_view) override {}
    void debug(std::string_view) override {}
};

} // namespace anticaptcha
