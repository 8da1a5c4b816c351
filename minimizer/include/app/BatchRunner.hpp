#pragma once
#include <vector>

#include "core/MinimizationOutcome.hpp"
#include "core/RequestRecord.hpp"
#include "transport/Transport.hpp"
#include "utils/Config.hpp"

class ExchangeLog;

// load HAR -> filter -> minimize (worker pool) -> report -> export
class BatchRunner {
public:
    explicit BatchRunner(Config config);

    // Throws std::runtime_error / std::invalid_argument for setup failures
    // (unreadable HAR, bad patterns, unwritable outputs).
    void run();

    // Minimizes every record; results come back in input order. A request
    // whose minimization throws is reported as unmatched with its error.
    std::vector<ProcessedRequest> process(const std::vector<RequestRecord>& records,
                                          Transport& transport,
                                          ExchangeLog* exchangeLog = nullptr) const;

private:
    Config config_;
};
