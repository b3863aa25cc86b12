#include "anticaptcha/logger.hpp"

#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace anticaptcha {

StreamLogger::StreamLogger(std::ostream& out, std::string prefix, bool enableDebug)
    : out(out), prefix(std::move(prefix)), enableDebug(enableDebug) {}

void StreamLogger::write(std::string_view level, std::string_view msg) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string line = fmt::format("{}{:%Y/%m/%d %H:%M:%S} {} {}\n", prefix, tm, level, msg);
    std::lock_guard<std::mutex> lock(writeMutex);
    out << line << std::flush;
}

void StreamLogger::info(std::string_view msg) { write("INFO", msg); }
void StreamLogger::warn(std::string_view msg) { write("WARN", msg); }
void StreamLogger::error(std::string_view msg) { write("ERROR", msg); }
void StreamLogger::debug(std::string_view msg) {
    if (enableDebug.load()) write("DEBUG", msg);
}

} // namespace anticaptcha
