#include "monitor/ExchangeLog.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// CSV-quote a free-text field
static std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out += "\"";
    return out;
}

ExchangeLog::ExchangeLog(const std::string& filePath) {
    file.open(filePath, std::ios::out | std::ios::app | std::ios::ate);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open exchange log: " + filePath);
    }
    if (file.tellp() == 0) {
        file << "timestamp,"
        "request_index,"
        "phase,"
        "status,"
        "length,"
        "elapsed_ms,"
        "equivalent,"
        "error\n";
    }
}

ExchangeLog::~ExchangeLog() {
    flush();
    file.close();
}

void ExchangeLog::log(const ExchangeRecord& e) {
    std::lock_guard<std::mutex> lock(mtx);

    file << e.timestamp << ","
     << e.request_index << ","
     << e.phase << ","
     << (e.status ? std::to_string(*e.status) : std::string()) << ","
     << e.length << ","
     << e.elapsed_ms << ","
     << (e.equivalent ? 1 : 0) << ","
     << csvField(e.error) << "\n";

    counter++;
    if (counter % 50 == 0)
        file.flush();
}

void ExchangeLog::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    file.flush();
}

std::string ExchangeLog::nowIso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}
