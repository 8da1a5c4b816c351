#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/RequestRecord.hpp"

// Reads a HAR document and turns log.entries[*].request into RequestRecords.
// The loader owns the parsed document; records point into it through
// rawEntry and must not outlive the loader.
class HarLoader {
public:
    HarLoader() = default;

    HarLoader(const HarLoader&) = delete;
    HarLoader& operator=(const HarLoader&) = delete;

    // Throws std::runtime_error if the file cannot be read or parsed.
    std::vector<RequestRecord> load(const std::string& path);
    std::vector<RequestRecord> loadFromString(const std::string& text);

    // Throws std::runtime_error before a successful load.
    const nlohmann::ordered_json& raw() const;

private:
    std::vector<RequestRecord> extract();

    nlohmann::ordered_json doc_;
    bool loaded_ = false;
};
