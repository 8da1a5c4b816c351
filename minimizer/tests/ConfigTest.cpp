#include "utils/Config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

TEST(ConfigTest, EmptyObjectGivesDefaults) {
    Config cfg = Config::fromJson(json::object());
    EXPECT_EQ(cfg.maxRoundsPerRequest, 100);
    EXPECT_EQ(cfg.workers, 1);
    EXPECT_TRUE(cfg.comparator.statusCode);
    EXPECT_TRUE(cfg.comparator.lengthCheck);
    EXPECT_EQ(cfg.comparator.logic, CombineLogic::And);
    EXPECT_EQ(cfg.minimization.order, (std::vector<Phase>{Phase::Headers, Phase::Body}));
    EXPECT_EQ(cfg.minimization.body.mode, BodyMode::Auto);
    EXPECT_TRUE(cfg.minimization.body.treatEmptyAsAbsent);
    EXPECT_DOUBLE_EQ(cfg.client.requestsPerSecond, 0.0);
}

TEST(ConfigTest, ReadsNestedSections) {
    json j = json::parse(R"({
        "input_har": "in.har",
        "max_rounds_per_request": 40,
        "workers": 4,
        "client": {"timeout": 3, "verify_tls": false,
                   "proxies": {"HTTPS": "http://127.0.0.1:8080", "http": ""},
                   "rate_limit": {"requests_per_second": 2.5}},
        "comparator": {"length_tolerance": 0.2, "need_all": ["ok"], "regex": "id=\\d+", "logic": "or"},
        "minimization": {
            "order": ["body", "headers"],
            "headers": {"protected": ["Host"], "ignore": ["cookie"], "candidate_regex": ["^x-"]},
            "body": {"body_type": "FORM", "protected_keys": ["csrf"], "only_keys": ["a"],
                     "treat_empty_as_absent": false, "try_blank_values": true}
        },
        "filter": {"methods": ["post"], "index_range": [2, 5]},
        "scope": {"include_regex": ["example"]}
    })");
    Config cfg = Config::fromJson(j);

    EXPECT_EQ(cfg.inputHar, "in.har");
    EXPECT_EQ(cfg.maxRoundsPerRequest, 40);
    EXPECT_EQ(cfg.workers, 4);
    EXPECT_DOUBLE_EQ(cfg.client.timeoutSeconds, 3.0);
    EXPECT_FALSE(cfg.client.verifyTls);
    EXPECT_EQ(cfg.client.proxies.size(), 1u);
    EXPECT_EQ(cfg.client.proxies.at("https"), "http://127.0.0.1:8080");
    EXPECT_DOUBLE_EQ(cfg.client.requestsPerSecond, 2.5);

    EXPECT_DOUBLE_EQ(cfg.comparator.lengthTolerance, 0.2);
    EXPECT_EQ(cfg.comparator.needAll, std::vector<std::string>{"ok"});
    EXPECT_EQ(cfg.comparator.regex, std::vector<std::string>{"id=\\d+"});
    EXPECT_EQ(cfg.comparator.logic, CombineLogic::Or);

    EXPECT_EQ(cfg.minimization.order, (std::vector<Phase>{Phase::Body, Phase::Headers}));
    EXPECT_EQ(cfg.minimization.headers.protectedNames, std::vector<std::string>{"Host"});
    EXPECT_EQ(cfg.minimization.headers.candidateRegex, std::vector<std::string>{"^x-"});
    EXPECT_EQ(cfg.minimization.body.mode, BodyMode::Form);
    EXPECT_FALSE(cfg.minimization.body.treatEmptyAsAbsent);
    EXPECT_TRUE(cfg.minimization.body.tryBlankValues);

    EXPECT_EQ(cfg.filter.methods, std::vector<std::string>{"post"});
    ASSERT_TRUE(cfg.filter.indexRange.has_value());
    EXPECT_EQ(cfg.filter.indexRange->first, 2u);
    EXPECT_EQ(cfg.filter.indexRange->second, 5u);
    EXPECT_EQ(cfg.scope.includeRegex, std::vector<std::string>{"example"});
}

TEST(ConfigTest, InvalidValuesFallBack) {
    json j = json::parse(R"({
        "workers": 0,
        "comparator": {"logic": "XOR"},
        "minimization": {"order": ["headers", "cookies", "headers"], "body": {"body_type": "xml"}}
    })");
    Config cfg = Config::fromJson(j);

    EXPECT_EQ(cfg.workers, 1);
    EXPECT_EQ(cfg.comparator.logic, CombineLogic::And);
    EXPECT_EQ(cfg.minimization.order, std::vector<Phase>{Phase::Headers});
    EXPECT_EQ(cfg.minimization.body.mode, BodyMode::Auto);
}

TEST(ConfigTest, LoadThrowsForMissingOrMalformedFile) {
    EXPECT_THROW(Config::load("/nonexistent/minimizer.json"), std::runtime_error);

    const std::string path = ::testing::TempDir() + "broken_config.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(Config::load(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(ConfigTest, LoadReadsFile) {
    const std::string path = ::testing::TempDir() + "good_config.json";
    {
        std::ofstream out(path);
        out << R"({"report_path": "r.json", "include_metadata": false})";
    }
    Config cfg = Config::load(path);
    EXPECT_EQ(cfg.reportPath, "r.json");
    EXPECT_FALSE(cfg.includeMetadata);
    std::remove(path.c_str());
}
