#include "report/HarExporter.hpp"

#include "monitor/Log.hpp"
#include "utils/FileUtil.hpp"

using ordered_json = nlohmann::ordered_json;

HarExporter::HarExporter(const ordered_json& rawHar) : raw_(rawHar) {}

void HarExporter::apply(const std::vector<ProcessedRequest>& processed, bool includeMetadata) {
    if (!raw_.contains("log") || !raw_["log"].contains("entries") || !raw_["log"]["entries"].is_array()) {
        LOGX(LogLevel::Warn, "Exporter", "HAR has no log.entries, nothing to rewrite");
        return;
    }
    ordered_json& entries = raw_["log"]["entries"];

    std::size_t rewritten = 0;
    for (const auto& item : processed) {
        if (!item.outcome.matched) continue;

        const std::size_t index = item.request.index;
        if (index >= entries.size()) continue;

        ordered_json& entry = entries[index];
        ordered_json& requestBlock = entry["request"];

        ordered_json headers = ordered_json::array();
        for (const auto& h : item.outcome.headers) {
            headers.push_back({{"name", h.name}, {"value", h.value}});
        }
        requestBlock["headers"] = headers;

        // an absent final body leaves the captured postData alone
        if (item.outcome.body) {
            ordered_json& postData = requestBlock["postData"];
            postData["text"] = *item.outcome.body;
            if (item.request.contentType && !postData.contains("mimeType")) {
                postData["mimeType"] = *item.request.contentType;
            }
        }

        if (includeMetadata) {
            ordered_json& meta = entry["_minimized"];
            meta["original_header_count"] = item.request.headers.size();
            meta["final_header_count"] = item.outcome.headers.size();
            meta["header_candidates"] = item.outcome.headerCandidates;
            meta["body_candidates"] = item.outcome.bodyCandidates;
            meta["matched"] = item.outcome.matched;
        }
        ++rewritten;
    }

    LOGX(LogLevel::Info, "Exporter", "Rewrote " << rewritten << " of " << processed.size() << " processed entries");
}

void HarExporter::write(const std::string& path) const {
    writeTextFile(path, raw_.dump(2, ' ', false, ordered_json::error_handler_t::replace));
    LOGX(LogLevel::Info, "Exporter", "Wrote " << path);
}
