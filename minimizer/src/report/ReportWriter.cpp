#include "report/ReportWriter.hpp"

#include "monitor/Log.hpp"
#include "utils/FileUtil.hpp"

using ordered_json = nlohmann::ordered_json;

static ordered_json optionalStatus(const ResponseSnapshot& snap) {
    if (!snap.statusCode) return nullptr;
    return *snap.statusCode;
}

ReportWriter::ReportWriter(std::string path) : path_(std::move(path)) {}

ordered_json ReportWriter::toJson(const ProcessedRequest& item) {
    const RequestRecord& req = item.request;
    const MinimizationOutcome& out = item.outcome;

    ordered_json query = ordered_json::object();
    for (const auto& kv : req.query) {
        if (kv.second.size() == 1) {
            query[kv.first] = kv.second.front();
        } else {
            query[kv.first] = kv.second;
        }
    }

    ordered_json headers = ordered_json::array();
    for (const auto& h : out.headers) {
        headers.push_back({{"name", h.name}, {"value", h.value}});
    }

    ordered_json error = nullptr;
    if (item.error) {
        error = *item.error;
    } else if (item.baseline.error) {
        error = *item.baseline.error;
    }

    ordered_json j;
    j["index"] = req.index;
    j["method"] = req.method;
    j["url"] = req.url;
    j["path"] = req.path;
    j["query"] = query;
    j["baseline"] = {{"status", optionalStatus(item.baseline)}, {"length", item.baseline.size()}};
    j["final"] = {{"status", optionalStatus(out.response)}, {"length", out.response.size()}};
    j["matched_baseline"] = out.matched;
    j["headers"] = {
        {"original", req.headers.size()},
        {"candidates", out.headerCandidates},
        {"final", out.finalHeaderCount},
    };
    j["body"] = {
        {"candidates", out.bodyCandidates},
        {"final_fields", out.finalBodyFieldCount},
    };
    j["minimized_headers"] = headers;
    j["minimized_body"] = out.body ? ordered_json(*out.body) : ordered_json(nullptr);
    j["error"] = error;
    return j;
}

void ReportWriter::write(const std::vector<ProcessedRequest>& processed) const {
    ordered_json data = ordered_json::array();
    for (const auto& item : processed) {
        data.push_back(toJson(item));
    }
    writeTextFile(path_, data.dump(2, ' ', false, ordered_json::error_handler_t::replace));
    LOGX(LogLevel::Info, "Report", "Wrote " << processed.size() << " entries to " << path_);
}
