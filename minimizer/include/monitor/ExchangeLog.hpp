#pragma once
#include <cstddef>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

struct ExchangeRecord {
    std::string timestamp;

    std::size_t request_index{};
    std::string phase;          // baseline / headers / body / verify / refine / confirm

    std::optional<int> status;
    std::size_t length{};
    double elapsed_ms{};

    bool equivalent{};
    std::string error;
};

// CSV trace of every exchange, one row per probe. Shared by all workers.
class ExchangeLog {
public:
    explicit ExchangeLog(const std::string& filePath);
    ~ExchangeLog();

    void log(const ExchangeRecord& e);
    void flush();

    static std::string nowIso8601();

private:
    std::ofstream file;
    std::mutex mtx;
    int counter = 0;
};
