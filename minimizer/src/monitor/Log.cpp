#include "monitor/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

static std::atomic<int> MIN_LEVEL{static_cast<int>(LogLevel::Info)};
static std::mutex writeMutex;

static inline long long nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void Log::setLevel(LogLevel level) {
    MIN_LEVEL.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool Log::enabled(LogLevel level) {
    return static_cast<int>(level) >= MIN_LEVEL.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Log::parseLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    return std::nullopt;
}

void Log::write(LogLevel level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(writeMutex);

    // warnings and errors go to stderr
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << nowMs() << "ms]"
        << "[TID " << std::this_thread::get_id() << "]"
        << "[" << levelName(level) << "]"
        << "[" << tag << "] " << msg << std::endl;
}
