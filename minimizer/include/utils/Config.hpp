#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

enum class CombineLogic { And, Or };

struct ComparatorConfig {
    bool statusCode = true;
    bool lengthCheck = true;
    double lengthTolerance = 0.05;
    std::vector<std::string> needAll;
    std::vector<std::string> needAny;
    std::vector<std::string> regex;
    CombineLogic logic = CombineLogic::And;
};

struct HeaderPolicy {
    bool enabled = true;
    std::vector<std::string> protectedNames;
    std::vector<std::string> ignoredNames;
    std::vector<std::string> candidateRegex;   // empty = every header is a candidate
};

enum class BodyMode { Auto, Json, Form };

struct BodyPolicy {
    bool enabled = true;
    BodyMode mode = BodyMode::Auto;
    std::vector<std::string> protectedKeys;
    std::vector<std::string> onlyKeys;         // empty = no allow-list
    bool treatEmptyAsAbsent = true;            // false: removed fields are sent blank
    bool tryBlankValues = false;
};

enum class Phase { Headers, Body };

struct MinimizationConfig {
    std::vector<Phase> order{Phase::Headers, Phase::Body};
    HeaderPolicy headers;
    BodyPolicy body;
};

struct ClientConfig {
    double timeoutSeconds = 15.0;
    bool verifyTls = true;
    std::map<std::string, std::string> proxies;   // scheme -> proxy url
    double requestsPerSecond = 0.0;               // 0 = no pacing
};

struct FilterConfig {
    std::vector<std::string> methods;
    std::vector<std::string> hosts;
    std::vector<std::string> urlRegex;
    std::optional<std::pair<std::size_t, std::size_t>> indexRange;
};

struct ScopeConfig {
    std::vector<std::string> includeUrls;
    std::vector<std::string> includeRegex;
};

class Config {
public:
    std::string inputHar;
    std::string outputHar = "out/minimized.har";
    std::string reportPath = "out/report.json";
    int maxRoundsPerRequest = 100;
    int workers = 1;
    std::string exchangeLog;        // empty = disabled
    bool includeMetadata = true;

    ClientConfig client;
    ComparatorConfig comparator;
    MinimizationConfig minimization;
    FilterConfig filter;
    ScopeConfig scope;

    Config() = default;

    // Throws std::runtime_error when the file is missing or not valid JSON.
    static Config load(const std::string& path);

    // Missing keys keep their defaults; bad enum values fall back with a warning.
    static Config fromJson(const nlohmann::json& j);
};
