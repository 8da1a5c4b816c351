#include "har/HarLoader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "monitor/Log.hpp"
#include "utils/UrlCodec.hpp"

using ordered_json = nlohmann::ordered_json;

static std::string stringField(const ordered_json& obj, const char* key, const std::string& fallback = "") {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) return fallback;
    return obj[key].get<std::string>();
}

std::vector<RequestRecord> HarLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open HAR file: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();

    try {
        return loadFromString(oss.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid HAR file " + path + ": " + e.what());
    }
}

std::vector<RequestRecord> HarLoader::loadFromString(const std::string& text) {
    ordered_json doc = ordered_json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("not a JSON object");
    }
    doc_ = std::move(doc);
    loaded_ = true;
    return extract();
}

const ordered_json& HarLoader::raw() const {
    if (!loaded_) {
        throw std::runtime_error("HAR content not loaded yet");
    }
    return doc_;
}

std::vector<RequestRecord> HarLoader::extract() {
    std::vector<RequestRecord> records;

    if (!doc_.contains("log") || !doc_["log"].is_object()) return records;
    const ordered_json& log = doc_["log"];
    if (!log.contains("entries") || !log["entries"].is_array()) return records;
    const ordered_json& entries = log["entries"];

    records.reserve(entries.size());
    for (std::size_t idx = 0; idx < entries.size(); ++idx) {
        const ordered_json& entry = entries[idx];
        static const ordered_json emptyObject = ordered_json::object();
        const ordered_json& req = (entry.is_object() && entry.contains("request") && entry["request"].is_object())
                                      ? entry["request"]
                                      : emptyObject;

        RequestRecord record;
        record.index = idx;
        record.method = stringField(req, "method", "GET");
        record.url = stringField(req, "url");
        record.rawEntry = &entry;

        // -------- URL parts --------
        UrlParts parts = splitUrl(record.url);
        record.path = parts.path;
        for (auto& kv : parseQueryString(parts.query, false)) {
            record.query[kv.first].push_back(std::move(kv.second));
        }

        // -------- Headers --------
        if (req.contains("headers") && req["headers"].is_array()) {
            for (const auto& h : req["headers"]) {
                std::string name = stringField(h, "name");
                if (name.empty()) continue;
                record.headers.push_back(HeaderEntry{name, stringField(h, "value")});
            }
        }

        // -------- Body --------
        if (req.contains("postData") && req["postData"].is_object()) {
            const ordered_json& post = req["postData"];
            if (post.contains("text") && post["text"].is_string()) {
                record.body = post["text"].get<std::string>();
            }
            if (post.contains("mimeType") && post["mimeType"].is_string()) {
                record.contentType = post["mimeType"].get<std::string>();
            }
        }

        records.push_back(std::move(record));
    }

    LOGX(LogLevel::Info, "HarLoader", "Loaded " << records.size() << " entries");
    return records;
}
