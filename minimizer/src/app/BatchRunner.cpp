#include "app/BatchRunner.hpp"

#include <exception>
#include <memory>
#include <stdexcept>

#include "compare/ResponseComparator.hpp"
#include "har/HarLoader.hpp"
#include "har/RequestFilter.hpp"
#include "minimize/RequestMinimizer.hpp"
#include "monitor/ExchangeLog.hpp"
#include "monitor/Log.hpp"
#include "report/HarExporter.hpp"
#include "report/ReportWriter.hpp"
#include "threadpool/ThreadPool.hpp"
#include "transport/CurlTransport.hpp"

BatchRunner::BatchRunner(Config config) : config_(std::move(config)) {}

void BatchRunner::run() {
    if (config_.inputHar.empty()) {
        throw std::invalid_argument("No input HAR configured (input_har / --input-har)");
    }

    HarLoader loader;
    std::vector<RequestRecord> records = loader.load(config_.inputHar);

    RequestFilter filter(config_.filter, config_.scope);
    std::vector<RequestRecord> selected = filter.apply(records);
    LOGX(LogLevel::Info, "Batch", "Selected " << selected.size() << " of " << records.size() << " requests");

    std::unique_ptr<ExchangeLog> exchangeLog;
    if (!config_.exchangeLog.empty()) {
        exchangeLog = std::make_unique<ExchangeLog>(config_.exchangeLog);
    }

    CurlTransport transport(config_.client);
    std::vector<ProcessedRequest> processed = process(selected, transport, exchangeLog.get());

    std::size_t matched = 0;
    for (const auto& p : processed) {
        if (p.outcome.matched) ++matched;
    }
    LOGX(LogLevel::Info, "Batch", matched << "/" << processed.size() << " requests matched their baseline");

    ReportWriter(config_.reportPath).write(processed);

    HarExporter exporter(loader.raw());
    exporter.apply(processed, config_.includeMetadata);
    exporter.write(config_.outputHar);
}

std::vector<ProcessedRequest> BatchRunner::process(const std::vector<RequestRecord>& records,
                                                   Transport& transport,
                                                   ExchangeLog* exchangeLog) const {
    ResponseComparator comparator(config_.comparator);
    RequestMinimizer minimizer(config_, transport, comparator, exchangeLog);

    std::vector<ProcessedRequest> results(records.size());
    {
        ThreadPool pool(config_.workers);

        for (std::size_t i = 0; i < records.size(); ++i) {
            pool.enqueue(Task(i, records[i].url, [&, i]() {
                const RequestRecord& record = records[i];
                ProcessedRequest& slot = results[i];
                slot.request = record;
                try {
                    MinimizationRun run = minimizer.minimize(record);
                    slot.baseline = std::move(run.baseline);
                    slot.outcome = std::move(run.outcome);
                } catch (const std::exception& e) {
                    LOGX(LogLevel::Error, "Batch", "Request #" << record.index << " failed: " << e.what());
                    slot.error = e.what();
                    slot.outcome.headers = record.headers;
                    slot.outcome.body = record.body;
                    slot.outcome.matched = false;
                    slot.outcome.headerCandidates = record.headers.size();
                    slot.outcome.finalHeaderCount = record.headers.size();
                }
            }));
        }

        pool.waitIdle();
    }
    return results;
}
