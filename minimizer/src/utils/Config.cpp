#include "utils/Config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include "monitor/Log.hpp"

using json = nlohmann::json;

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::vector<std::string> stringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    const json& v = j[key];
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
        return out;
    }
    for (const auto& item : v) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

static const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    if (j.contains(key) && j[key].is_object()) return j[key];
    return empty;
}

// =======================
//  Sections
// =======================
static ClientConfig parseClient(const json& j) {
    ClientConfig c;
    c.timeoutSeconds = j.value("timeout", c.timeoutSeconds);
    c.verifyTls      = j.value("verify_tls", c.verifyTls);

    const json& proxies = section(j, "proxies");
    for (auto it = proxies.begin(); it != proxies.end(); ++it) {
        if (!it.value().is_string()) continue;
        std::string url = it.value().get<std::string>();
        if (!url.empty()) c.proxies[lower(it.key())] = url;
    }

    const json& rate = section(j, "rate_limit");
    if (rate.contains("requests_per_second") && rate["requests_per_second"].is_number()) {
        c.requestsPerSecond = rate["requests_per_second"].get<double>();
    }
    if (c.requestsPerSecond < 0.0) {
        LOGX(LogLevel::Warn, "Config", "Negative requests_per_second, pacing disabled");
        c.requestsPerSecond = 0.0;
    }
    if (c.timeoutSeconds <= 0.0) {
        LOGX(LogLevel::Warn, "Config", "Invalid timeout " << c.timeoutSeconds << ", fallback to 15s");
        c.timeoutSeconds = 15.0;
    }
    return c;
}

static ComparatorConfig parseComparator(const json& j) {
    ComparatorConfig c;
    c.statusCode      = j.value("status_code", c.statusCode);
    c.lengthCheck     = j.value("length_check", c.lengthCheck);
    c.lengthTolerance = j.value("length_tolerance", c.lengthTolerance);
    c.needAll         = stringList(j, "need_all");
    c.needAny         = stringList(j, "need_any");
    c.regex           = stringList(j, "regex");

    std::string logic = lower(j.value("logic", std::string("and")));
    if (logic == "or") {
        c.logic = CombineLogic::Or;
    } else {
        if (logic != "and") {
            LOGX(LogLevel::Warn, "Config", "Invalid comparator logic: " << logic << ", fallback to 'AND'");
        }
        c.logic = CombineLogic::And;
    }
    return c;
}

static HeaderPolicy parseHeaders(const json& j) {
    HeaderPolicy h;
    h.enabled        = j.value("enabled", h.enabled);
    h.protectedNames = stringList(j, "protected");
    h.ignoredNames   = stringList(j, "ignore");
    h.candidateRegex = stringList(j, "candidate_regex");
    return h;
}

static BodyPolicy parseBody(const json& j) {
    BodyPolicy b;
    b.enabled            = j.value("enabled", b.enabled);
    b.protectedKeys      = stringList(j, "protected_keys");
    b.onlyKeys           = stringList(j, "only_keys");
    b.treatEmptyAsAbsent = j.value("treat_empty_as_absent", b.treatEmptyAsAbsent);
    b.tryBlankValues     = j.value("try_blank_values", b.tryBlankValues);

    std::string mode = lower(j.value("body_type", std::string("auto")));
    if (mode == "json") {
        b.mode = BodyMode::Json;
    } else if (mode == "form") {
        b.mode = BodyMode::Form;
    } else {
        if (mode != "auto") {
            LOGX(LogLevel::Warn, "Config", "Invalid body_type: " << mode << ", fallback to 'auto'");
        }
        b.mode = BodyMode::Auto;
    }
    return b;
}

static MinimizationConfig parseMinimization(const json& j) {
    MinimizationConfig m;
    if (j.contains("order")) {
        m.order.clear();
        for (const auto& name : stringList(j, "order")) {
            std::string n = lower(name);
            Phase p;
            if (n == "headers") {
                p = Phase::Headers;
            } else if (n == "body") {
                p = Phase::Body;
            } else {
                LOGX(LogLevel::Warn, "Config", "Unknown minimization phase '" << name << "' ignored");
                continue;
            }
            if (std::find(m.order.begin(), m.order.end(), p) == m.order.end()) {
                m.order.push_back(p);
            }
        }
    }
    m.headers = parseHeaders(section(j, "headers"));
    m.body    = parseBody(section(j, "body"));
    return m;
}

static FilterConfig parseFilter(const json& j) {
    FilterConfig f;
    f.methods  = stringList(j, "methods");
    f.hosts    = stringList(j, "hosts");
    f.urlRegex = stringList(j, "url_regex");
    if (j.contains("index_range") && j["index_range"].is_array() && j["index_range"].size() == 2) {
        f.indexRange = std::make_pair(j["index_range"][0].get<std::size_t>(),
                                      j["index_range"][1].get<std::size_t>());
    }
    return f;
}

static ScopeConfig parseScope(const json& j) {
    ScopeConfig s;
    s.includeUrls  = stringList(j, "include_urls");
    s.includeRegex = stringList(j, "include_regex");
    return s;
}

// =======================
//  Config
// =======================
Config Config::fromJson(const json& j) {
    Config cfg;

    cfg.inputHar            = j.value("input_har", cfg.inputHar);
    cfg.outputHar           = j.value("output_har", cfg.outputHar);
    cfg.reportPath          = j.value("report_path", cfg.reportPath);
    cfg.maxRoundsPerRequest = j.value("max_rounds_per_request", cfg.maxRoundsPerRequest);
    cfg.workers             = j.value("workers", cfg.workers);
    cfg.exchangeLog         = j.value("exchange_log", cfg.exchangeLog);
    cfg.includeMetadata     = j.value("include_metadata", cfg.includeMetadata);

    if (cfg.workers < 1) {
        LOGX(LogLevel::Warn, "Config", "Invalid workers: " << cfg.workers << ", fallback to 1");
        cfg.workers = 1;
    }

    cfg.client       = parseClient(section(j, "client"));
    cfg.comparator   = parseComparator(section(j, "comparator"));
    cfg.minimization = parseMinimization(section(j, "minimization"));
    cfg.filter       = parseFilter(section(j, "filter"));
    cfg.scope        = parseScope(section(j, "scope"));
    return cfg;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Invalid config file " + path + ": top level must be an object");
    }

    try {
        Config cfg = fromJson(j);
        LOGX(LogLevel::Info, "Config", "Loaded " << path
             << ": budget=" << cfg.maxRoundsPerRequest
             << ", workers=" << cfg.workers
             << ", rps=" << cfg.client.requestsPerSecond);
        return cfg;
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}
