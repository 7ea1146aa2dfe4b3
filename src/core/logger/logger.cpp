#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Prowl {
namespace Core {

int Logger::level_ = LogLevel::LOG_DEFAULT;

std::mutex Logger::mutex_;

namespace {
const char* RESET  = "\033[0m";
const char* RED    = "\033[31m";
const char* GREEN  = "\033[32m";
const char* YELLOW = "\033[33m";
const char* BLUE   = "\033[34m";
const char* GREY   = "\033[90m";

std::string timestamp() {
    auto        now  = std::chrono::system_clock::now();
    std::time_t t    = std::chrono::system_clock::to_time_t(now);
    auto        ms   = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()).count() % 1000;
    std::tm     tm{};
    localtime_r(&t, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return out.str();
}
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

int Logger::parse_level(const std::string& name) {
    if (name == "quiet")
        return LOG_NONE;
    if (name == "error")
        return LOG_ERROR;
    if (name == "warn")
        return LOG_ERROR | LOG_WARN;
    if (name == "info")
        return LOG_DEFAULT;
    if (name == "debug")
        return LOG_ALL;
    throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::write(int level, const char* color, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;

    std::ostream& out = (level & (LOG_WARN | LOG_ERROR)) ? std::cerr : std::cout;
    out << GREY << timestamp() << ' ' << color << tag << RESET << message << std::endl;
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, GREY, "[DEBUG] ", message);
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, BLUE, "[INFO] ", message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, GREEN, "[SUCCESS] ", message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, YELLOW, "[WARN] ", message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, RED, "[ERROR] ", message);
}

}  // namespace Core
}  // namespace Prowl
